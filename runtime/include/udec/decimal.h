#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// libmpdec value type; <mpdecimal.h> is only included by the implementation.
struct mpd_t;

namespace udec {

struct DecimalError : public std::runtime_error {
  explicit DecimalError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Owning handle to a libmpdec decimal. Trailing zeros of the coefficient are
// significant and preserved: 2.0 and 2 are different values here.
class Decimal {
 public:
  // decimal128 limits.
  static constexpr int kPrecision = 34;
  static constexpr int kMaxExponent = 6144 - (kPrecision - 1);
  static constexpr int kMinExponent = -6143 - (kPrecision - 1);

  Decimal();
  ~Decimal();
  Decimal(const Decimal& other);
  Decimal& operator=(const Decimal& other);

  static Decimal one();
  static Decimal from_int(long long value);
  // 1 * 10^exponent
  static Decimal unit(int exponent);

  bool negative() const;
  bool is_zero() const;
  // Significant digits of the coefficient; 1 for zero.
  int digits() const;
  int exponent() const;

  Decimal negated() const;
  Decimal abs() const;
  // Same sign, coefficient and exponent.
  bool identical(const Decimal& other) const;

  std::string to_string() const;

 private:
  friend class Context;

  mpd_t* value_;
};

// Round-half-up arithmetic at a fixed precision with decimal128 exponent
// limits. Constructed per call; holds no shared state.
class Context {
 public:
  explicit Context(int precision = Decimal::kPrecision);

  int precision() const { return precision_; }

  Decimal add(const Decimal& lhs, const Decimal& rhs) const;
  Decimal subtract(const Decimal& lhs, const Decimal& rhs) const;
  Decimal multiply(const Decimal& lhs, const Decimal& rhs) const;
  Decimal divide(const Decimal& lhs, const Decimal& rhs) const;
  Decimal sqrt(const Decimal& operand) const;

  // Result has exactly `exponent`; fails when the coefficient would exceed
  // the precision.
  Decimal rescale(const Decimal& value, int exponent) const;
  Decimal quantize(const Decimal& value, const Decimal& pattern) const;

  // Finite decimals only; rounds to the precision.
  bool try_parse(std::string_view text, Decimal& out) const;
  Decimal parse(std::string_view text) const;

 private:
  int precision_;
};

} // namespace udec
