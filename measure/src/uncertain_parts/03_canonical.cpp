
UncertainValue canonicalize(const Decimal& value, const Decimal& uncertainty) {
  const Context context;
  Decimal aligned = value;
  Decimal spread = with_max_digits(context, uncertainty.abs(), 1);
  if (value.exponent() <= spread.exponent()) {
    aligned = context.quantize(value, spread);
  } else {
    // The value's own last digit is coarser than the one-digit uncertainty.
    spread = Decimal::unit(value.exponent());
  }

  UncertainValue out(aligned, spread);
  if (trace_enabled()) {
    trace_result("canonical", format_pair(value, uncertainty), out);
  }
  return out;
}

UncertainValue::UncertainValue(Decimal value, Decimal uncertainty)
    : value_(value), uncertainty_(uncertainty) {
  if (uncertainty_.negative() && !uncertainty_.is_zero()) {
    throw DomainError("uncertainty must be non-negative, got " + uncertainty_.to_string());
  }
}

UncertainValue UncertainValue::canonical() const {
  return canonicalize(value_, uncertainty_);
}

bool UncertainValue::is_canonical() const {
  return canonical() == *this;
}

UncertainValue UncertainValue::with_digits(int digits) const {
  return canonicalize(udec::with_digits(value_, digits), uncertainty_);
}
