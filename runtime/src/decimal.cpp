#include <cstdint>
#include <new>
#include <string>
#include <string_view>

#include <mpdecimal.h>

#include "udec/decimal.h"

namespace udec {

namespace {

// Any of these means the result is not a usable finite decimal.
constexpr std::uint32_t kFaultStatus = MPD_Errors | MPD_Overflow;

mpd_t* new_value() {
  mpd_t* value = mpd_qnew();
  if (!value) {
    throw std::bad_alloc();
  }
  return value;
}

// decimal128 exponent limits (clamped), round-half-up, `precision` digits.
mpd_context_t make_context(int precision) {
  mpd_context_t context;
  if (mpd_ieee_context(&context, MPD_DECIMAL128) != 0 || !mpd_qsetprec(&context, precision) ||
      !mpd_qsetround(&context, MPD_ROUND_HALF_UP)) {
    throw DecimalError("invalid decimal context precision " + std::to_string(precision));
  }
  return context;
}

void require_ok(std::uint32_t status, std::string_view operation) {
  if ((status & kFaultStatus) == 0) {
    return;
  }
  std::string reason = "invalid operation";
  if (status & MPD_Division_by_zero) {
    reason = "division by zero";
  } else if (status & MPD_Overflow) {
    reason = "exponent overflow";
  } else if (status & MPD_Malloc_error) {
    throw std::bad_alloc();
  }
  throw DecimalError(std::string(operation) + ": " + reason);
}

}  // namespace

Decimal::Decimal() : value_(new_value()) {
  const mpd_context_t context = make_context(kPrecision);
  std::uint32_t status = 0;
  mpd_qset_ssize(value_, 0, &context, &status);
  if (status & MPD_Malloc_error) {
    mpd_del(value_);
    throw std::bad_alloc();
  }
}

Decimal::~Decimal() {
  mpd_del(value_);
}

Decimal::Decimal(const Decimal& other) : value_(new_value()) {
  std::uint32_t status = 0;
  if (!mpd_qcopy(value_, other.value_, &status)) {
    mpd_del(value_);
    throw std::bad_alloc();
  }
}

Decimal& Decimal::operator=(const Decimal& other) {
  if (this != &other) {
    std::uint32_t status = 0;
    if (!mpd_qcopy(value_, other.value_, &status)) {
      throw std::bad_alloc();
    }
  }
  return *this;
}

Decimal Decimal::one() {
  return from_int(1);
}

Decimal Decimal::from_int(long long value) {
  const mpd_context_t context = make_context(kPrecision);
  Decimal out;
  std::uint32_t status = 0;
  mpd_qset_i64(out.value_, static_cast<std::int64_t>(value), &context, &status);
  require_ok(status, "from_int");
  return out;
}

Decimal Decimal::unit(int exponent) {
  return Context().parse("1E" + std::to_string(exponent));
}

bool Decimal::negative() const {
  return mpd_isnegative(value_);
}

bool Decimal::is_zero() const {
  return mpd_iszero(value_);
}

int Decimal::digits() const {
  return static_cast<int>(value_->digits);
}

int Decimal::exponent() const {
  return static_cast<int>(value_->exp);
}

Decimal Decimal::negated() const {
  Decimal out = *this;
  mpd_set_sign(out.value_, mpd_isnegative(value_) ? MPD_POS : MPD_NEG);
  return out;
}

Decimal Decimal::abs() const {
  Decimal out = *this;
  mpd_set_positive(out.value_);
  return out;
}

bool Decimal::identical(const Decimal& other) const {
  return mpd_cmp_total(value_, other.value_) == 0;
}

std::string Decimal::to_string() const {
  char* raw = mpd_to_sci(value_, 1);
  if (!raw) {
    throw std::bad_alloc();
  }
  std::string out(raw);
  mpd_free(raw);
  return out;
}

Context::Context(int precision) : precision_(precision) {
  if (precision < 1) {
    throw DecimalError("decimal context precision must be positive, got " + std::to_string(precision));
  }
  (void)make_context(precision);
}

Decimal Context::add(const Decimal& lhs, const Decimal& rhs) const {
  const mpd_context_t context = make_context(precision_);
  Decimal out;
  std::uint32_t status = 0;
  mpd_qadd(out.value_, lhs.value_, rhs.value_, &context, &status);
  require_ok(status, "add");
  return out;
}

Decimal Context::subtract(const Decimal& lhs, const Decimal& rhs) const {
  const mpd_context_t context = make_context(precision_);
  Decimal out;
  std::uint32_t status = 0;
  mpd_qsub(out.value_, lhs.value_, rhs.value_, &context, &status);
  require_ok(status, "subtract");
  return out;
}

Decimal Context::multiply(const Decimal& lhs, const Decimal& rhs) const {
  const mpd_context_t context = make_context(precision_);
  Decimal out;
  std::uint32_t status = 0;
  mpd_qmul(out.value_, lhs.value_, rhs.value_, &context, &status);
  require_ok(status, "multiply");
  return out;
}

Decimal Context::divide(const Decimal& lhs, const Decimal& rhs) const {
  const mpd_context_t context = make_context(precision_);
  Decimal out;
  std::uint32_t status = 0;
  mpd_qdiv(out.value_, lhs.value_, rhs.value_, &context, &status);
  require_ok(status, "divide");
  return out;
}

Decimal Context::sqrt(const Decimal& operand) const {
  const mpd_context_t context = make_context(precision_);
  Decimal out;
  std::uint32_t status = 0;
  mpd_qsqrt(out.value_, operand.value_, &context, &status);
  require_ok(status, "sqrt of " + operand.to_string());
  return out;
}

Decimal Context::rescale(const Decimal& value, int exponent) const {
  const mpd_context_t context = make_context(precision_);
  if (exponent < mpd_etiny(&context) || exponent > mpd_etop(&context)) {
    throw DecimalError("rescale: exponent " + std::to_string(exponent) + " out of range");
  }
  Decimal out;
  std::uint32_t status = 0;
  mpd_qrescale(out.value_, value.value_, exponent, &context, &status);
  require_ok(status, "rescale");
  if (out.digits() > precision_) {
    throw DecimalError("rescale: " + value.to_string() + " at exponent " + std::to_string(exponent) +
                       " exceeds " + std::to_string(precision_) + " digits");
  }
  return out;
}

Decimal Context::quantize(const Decimal& value, const Decimal& pattern) const {
  const mpd_context_t context = make_context(precision_);
  Decimal out;
  std::uint32_t status = 0;
  mpd_qquantize(out.value_, value.value_, pattern.value_, &context, &status);
  require_ok(status, "quantize");
  return out;
}

bool Context::try_parse(std::string_view text, Decimal& out) const {
  if (text.empty() || text.find('\0') != std::string_view::npos) {
    return false;
  }
  const mpd_context_t context = make_context(precision_);
  const std::string terminated(text);
  Decimal parsed;
  std::uint32_t status = 0;
  mpd_qset_string(parsed.value_, terminated.c_str(), &context, &status);
  if ((status & kFaultStatus) != 0 || mpd_isspecial(parsed.value_)) {
    return false;
  }
  out = parsed;
  return true;
}

Decimal Context::parse(std::string_view text) const {
  Decimal out;
  if (!try_parse(text, out)) {
    throw DecimalError("malformed decimal: '" + std::string(text) + "'");
  }
  return out;
}

} // namespace udec
