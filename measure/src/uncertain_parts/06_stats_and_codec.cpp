
UncertainValue average(const std::vector<Decimal>& samples) {
  if (samples.size() < 2) {
    throw DomainError("average: sample standard deviation needs at least 2 samples, got " +
                      std::to_string(samples.size()));
  }
  const Context context;
  const Decimal count = Decimal::from_int(static_cast<long long>(samples.size()));

  Decimal total;
  for (const auto& sample : samples) {
    total = context.add(total, sample);
  }
  const Decimal mean = context.divide(total, count);

  Decimal squares;
  for (const auto& sample : samples) {
    const Decimal deviation = context.subtract(sample, mean);
    squares = context.add(squares, context.multiply(deviation, deviation));
  }
  const Decimal variance = context.divide(squares, context.subtract(count, Decimal::one()));

  UncertainValue out = canonicalize(mean, boosted_sqrt(variance));
  if (trace_enabled()) {
    trace_result("average", std::to_string(samples.size()) + " samples", out);
  }
  return out;
}

namespace {

// UTF-8 encodings of the non-ASCII White_Space code points.
constexpr std::string_view kUnicodeSpaces[] = {
    "\xC2\x85",     "\xC2\xA0",     "\xE1\x9A\x80", "\xE2\x80\x80", "\xE2\x80\x81",
    "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86",
    "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8",
    "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80",
};

std::size_t leading_space_width(std::string_view text) {
  if (text.empty()) {
    return 0;
  }
  if (std::isspace(static_cast<unsigned char>(text.front()))) {
    return 1;
  }
  for (const auto space : kUnicodeSpaces) {
    if (text.substr(0, space.size()) == space) {
      return space.size();
    }
  }
  return 0;
}

std::size_t trailing_space_width(std::string_view text) {
  if (text.empty()) {
    return 0;
  }
  if (std::isspace(static_cast<unsigned char>(text.back()))) {
    return 1;
  }
  for (const auto space : kUnicodeSpaces) {
    if (text.size() >= space.size() && text.substr(text.size() - space.size()) == space) {
      return space.size();
    }
  }
  return 0;
}

std::string_view trim_whitespace(std::string_view text) {
  for (std::size_t width = leading_space_width(text); width > 0; width = leading_space_width(text)) {
    text.remove_prefix(width);
  }
  for (std::size_t width = trailing_space_width(text); width > 0; width = trailing_space_width(text)) {
    text.remove_suffix(width);
  }
  return text;
}

}  // namespace

UncertainValue UncertainValue::of(std::string_view value_text, std::string_view uncertainty_text) {
  std::string text(value_text);
  text.push_back(' ');
  text += kPlusMinus;
  text.push_back(' ');
  text += uncertainty_text;
  return parse(text);
}

bool UncertainValue::try_parse(std::string_view text, UncertainValue& out) {
  const auto separator = text.find(kPlusMinus);
  if (separator == std::string_view::npos) {
    return false;
  }
  const Context context;
  Decimal value;
  Decimal uncertainty;
  if (!context.try_parse(trim_whitespace(text.substr(0, separator)), value) ||
      !context.try_parse(trim_whitespace(text.substr(separator + kPlusMinus.size())), uncertainty)) {
    return false;
  }
  if (uncertainty.negative() && !uncertainty.is_zero()) {
    return false;
  }
  out = UncertainValue(value, uncertainty.abs());
  return true;
}

UncertainValue UncertainValue::parse(std::string_view text) {
  UncertainValue out;
  if (!try_parse(text, out)) {
    throw ParseError("malformed uncertain value: '" + std::string(text) + "'");
  }
  return out;
}

std::string UncertainValue::to_string() const {
  return format_pair(value_, uncertainty_);
}

bool operator==(const UncertainValue& lhs, const UncertainValue& rhs) {
  return lhs.value().identical(rhs.value()) && lhs.uncertainty().identical(rhs.uncertainty());
}

bool operator!=(const UncertainValue& lhs, const UncertainValue& rhs) {
  return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& out, const UncertainValue& value) {
  return out << value.to_string();
}

} // namespace udec
