#pragma once

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "udec/decimal.h"

namespace udec {

struct ParseError : public std::runtime_error {
  explicit ParseError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// A documented precondition of an operation was violated (zero central value
// in relative-error propagation, too few samples, bad digit target, ...).
struct DomainError : public std::runtime_error {
  explicit DomainError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

struct InternalError : public std::logic_error {
  explicit InternalError(std::string msg) : std::logic_error(std::move(msg)) {}
};

// Measured quantity: best estimate plus one standard error.
//
// The canonical form keeps exactly one significant digit of uncertainty and
// rounds the value to the same decimal place. When the value is coarser than
// that digit, the uncertainty becomes 1 unit of the value's last place.
// Every arithmetic result is canonical; direct construction and parsing keep
// the operands as given.
class UncertainValue {
 public:
  UncertainValue() = default;
  UncertainValue(Decimal value, Decimal uncertainty);

  static UncertainValue of(std::string_view value_text, std::string_view uncertainty_text);
  // "<value> ± <uncertainty>"
  static bool try_parse(std::string_view text, UncertainValue& out);
  static UncertainValue parse(std::string_view text);

  const Decimal& value() const { return value_; }
  const Decimal& uncertainty() const { return uncertainty_; }

  UncertainValue canonical() const;
  bool is_canonical() const;
  // Re-rounds the value to `digits` significant digits (1..34), then
  // canonicalizes.
  UncertainValue with_digits(int digits) const;

  UncertainValue add(const UncertainValue& rhs) const;
  UncertainValue subtract(const UncertainValue& rhs) const;
  UncertainValue multiply(const UncertainValue& rhs) const;
  UncertainValue divide(const UncertainValue& rhs) const;
  UncertainValue negate() const;

  std::string to_string() const;

 private:
  Decimal value_;
  Decimal uncertainty_;
};

UncertainValue operator+(const UncertainValue& lhs, const UncertainValue& rhs);
UncertainValue operator-(const UncertainValue& lhs, const UncertainValue& rhs);
UncertainValue operator*(const UncertainValue& lhs, const UncertainValue& rhs);
UncertainValue operator/(const UncertainValue& lhs, const UncertainValue& rhs);
UncertainValue operator-(const UncertainValue& operand);

// Representation equality of both components.
bool operator==(const UncertainValue& lhs, const UncertainValue& rhs);
bool operator!=(const UncertainValue& lhs, const UncertainValue& rhs);
std::ostream& operator<<(std::ostream& out, const UncertainValue& value);

// Quadrature sum of independent values; empty input gives 0 ± 0.
UncertainValue sum(const std::vector<UncertainValue>& values);
// Product with relative errors added in quadrature; empty input gives 1 ± 0.
UncertainValue product(const std::vector<UncertainValue>& values);
// Mean ± Bessel-corrected sample standard deviation. Needs two samples.
UncertainValue average(const std::vector<Decimal>& samples);

} // namespace udec
