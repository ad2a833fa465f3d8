#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "udec/digits.h"
#include "udec/uncertain.h"
#include "uncertain_parts/internal_helpers.h"

namespace udec {

namespace {

// One rescale step adds or drops a digit, except when rounding carries
// (99.9 -> 100), so twice the coefficient width always suffices.
constexpr int kMaxAdjustSteps = 2 * Decimal::kPrecision + 2;

void require_digit_target(int digits) {
  if (digits < 1 || digits > Decimal::kPrecision) {
    throw DomainError("significant digit target must be within 1.." +
                      std::to_string(Decimal::kPrecision) + ", got " + std::to_string(digits));
  }
}

[[noreturn]] void adjust_did_not_converge(const Decimal& value, int target) {
  throw InternalError("digit adjustment of " + value.to_string() + " to " + std::to_string(target) +
                      " digits did not converge");
}

[[noreturn]] void exponent_limit_reached(const Decimal& value, int target) {
  throw DomainError("cannot bring " + value.to_string() + " to " + std::to_string(target) +
                    " significant digits within the decimal exponent range");
}

}  // namespace

bool trace_enabled() {
  static const bool enabled = env_flag_enabled("UDEC_TRACE", false);
  return enabled;
}

void trace_result(std::string_view stage, const std::string& input, const UncertainValue& result) {
  std::cerr << "udec[" << stage << "] " << input << " -> " << result.to_string() << "\n";
}

std::string format_pair(const Decimal& value, const Decimal& uncertainty) {
  std::string out = value.to_string();
  out.push_back(' ');
  out += kPlusMinus;
  out.push_back(' ');
  out += uncertainty.to_string();
  return out;
}

Decimal with_min_digits(const Context& context, Decimal value, int min_digits) {
  if (value.is_zero()) {
    return value;
  }
  const Decimal original = value;
  for (int step = 0; value.digits() < min_digits; ++step) {
    if (step >= kMaxAdjustSteps) {
      adjust_did_not_converge(original, min_digits);
    }
    if (value.exponent() <= Decimal::kMinExponent) {
      exponent_limit_reached(original, min_digits);
    }
    value = context.rescale(value, value.exponent() - 1);
  }
  return value;
}

Decimal with_max_digits(const Context& context, Decimal value, int max_digits) {
  const Decimal original = value;
  for (int step = 0; value.digits() > max_digits; ++step) {
    if (step >= kMaxAdjustSteps) {
      adjust_did_not_converge(original, max_digits);
    }
    if (value.exponent() >= Decimal::kMaxExponent) {
      exponent_limit_reached(original, max_digits);
    }
    value = context.rescale(value, value.exponent() + 1);
  }
  return value;
}

Decimal with_digits(const Decimal& value, int digits) {
  require_digit_target(digits);
  const Context context;
  return with_max_digits(context, with_min_digits(context, value, digits), digits);
}
