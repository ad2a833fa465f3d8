#pragma once

#include "udec/decimal.h"

namespace udec {

// Working precision for quadrature square roots; wider than Decimal::kPrecision.
constexpr int kSqrtWorkingDigits = 36;

// Rescales one decimal place at a time until `value` carries at least
// `min_digits` significant digits. Zero is returned unchanged.
Decimal with_min_digits(const Context& context, Decimal value, int min_digits);

// Rescales one decimal place at a time (dropping the last digit each step)
// until `value` carries at most `max_digits` significant digits.
Decimal with_max_digits(const Context& context, Decimal value, int max_digits);

// with_min_digits then with_max_digits under round-half-up.
Decimal with_digits(const Decimal& value, int digits);

// sqrt at kSqrtWorkingDigits, round-half-up, narrowed back to a Decimal.
Decimal boosted_sqrt(const Decimal& operand);

} // namespace udec
