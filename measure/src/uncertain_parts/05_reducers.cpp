
UncertainValue sum(const std::vector<UncertainValue>& values) {
  const Context context;
  Decimal total;
  Decimal variance;
  for (const auto& item : values) {
    total = context.add(total, item.value());
    variance = context.add(variance, context.multiply(item.uncertainty(), item.uncertainty()));
  }
  UncertainValue out = canonicalize(total, boosted_sqrt(variance));
  if (trace_enabled()) {
    trace_result("sum", std::to_string(values.size()) + " values", out);
  }
  return out;
}

UncertainValue product(const std::vector<UncertainValue>& values) {
  const Context context;
  Decimal total = Decimal::one();
  // Relative variances start from zero: an empty or exact product has no
  // uncertainty of its own.
  Decimal relative;
  for (const auto& item : values) {
    relative = context.add(relative, relative_variance(context, item, "product"));
    total = context.multiply(total, item.value());
  }
  UncertainValue out = canonicalize(total, context.multiply(boosted_sqrt(relative), total));
  if (trace_enabled()) {
    trace_result("product", std::to_string(values.size()) + " values", out);
  }
  return out;
}
