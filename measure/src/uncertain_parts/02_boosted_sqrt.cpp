Decimal boosted_sqrt(const Decimal& operand) {
  const Context wide(kSqrtWorkingDigits);
  const std::string text = wide.sqrt(operand).to_string();
  const Context narrow;
  Decimal out;
  if (!narrow.try_parse(text, out)) {
    throw InternalError("boosted sqrt: could not narrow '" + text + "' back to a decimal");
  }
  return out;
}
