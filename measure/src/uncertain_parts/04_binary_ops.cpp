
namespace {

// The combined value keeps no more significant digits than the less precise
// operand.
int weaker_digits(const Decimal& lhs, const Decimal& rhs) {
  return std::min(lhs.digits(), rhs.digits());
}

// (u / v)^2, evaluated as u * u / v / v.
Decimal relative_variance(const Context& context, const UncertainValue& operand, std::string_view operation) {
  if (operand.value().is_zero()) {
    throw DomainError(std::string(operation) + ": relative uncertainty of " + operand.to_string() +
                      " is undefined for a zero central value");
  }
  const Decimal squared = context.multiply(operand.uncertainty(), operand.uncertainty());
  return context.divide(context.divide(squared, operand.value()), operand.value());
}

}  // namespace

UncertainValue UncertainValue::add(const UncertainValue& rhs) const {
  const Context context;
  const Decimal combined =
      udec::with_digits(context.add(value_, rhs.value_), weaker_digits(value_, rhs.value_));
  const Decimal variance = context.add(context.multiply(uncertainty_, uncertainty_),
                                       context.multiply(rhs.uncertainty_, rhs.uncertainty_));
  return canonicalize(combined, boosted_sqrt(variance));
}

UncertainValue UncertainValue::subtract(const UncertainValue& rhs) const {
  return add(rhs.negate());
}

UncertainValue UncertainValue::multiply(const UncertainValue& rhs) const {
  const Context context;
  const Decimal relative = context.add(relative_variance(context, *this, "multiply"),
                                       relative_variance(context, rhs, "multiply"));
  const Decimal combined =
      udec::with_digits(context.multiply(value_, rhs.value_), weaker_digits(value_, rhs.value_));
  const Decimal spread =
      context.multiply(context.multiply(boosted_sqrt(relative), value_), rhs.value_);
  return canonicalize(combined, spread);
}

UncertainValue UncertainValue::divide(const UncertainValue& rhs) const {
  const Context context;
  const Decimal relative = context.add(relative_variance(context, *this, "divide"),
                                       relative_variance(context, rhs, "divide"));
  const Decimal combined =
      udec::with_digits(context.divide(value_, rhs.value_), weaker_digits(value_, rhs.value_));
  const Decimal spread =
      context.divide(context.multiply(boosted_sqrt(relative), value_), rhs.value_);
  return canonicalize(combined, spread);
}

UncertainValue UncertainValue::negate() const {
  return UncertainValue(value_.negated(), uncertainty_);
}

UncertainValue operator+(const UncertainValue& lhs, const UncertainValue& rhs) {
  return lhs.add(rhs);
}

UncertainValue operator-(const UncertainValue& lhs, const UncertainValue& rhs) {
  return lhs.subtract(rhs);
}

UncertainValue operator*(const UncertainValue& lhs, const UncertainValue& rhs) {
  return lhs.multiply(rhs);
}

UncertainValue operator/(const UncertainValue& lhs, const UncertainValue& rhs) {
  return lhs.divide(rhs);
}

UncertainValue operator-(const UncertainValue& operand) {
  return operand.negate();
}
