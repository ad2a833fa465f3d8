#pragma once

#include <cstdlib>
#include <string>
#include <string_view>

#include "udec/decimal.h"
#include "udec/uncertain.h"

namespace udec {

// U+00B1 PLUS-MINUS SIGN, UTF-8 encoded.
constexpr std::string_view kPlusMinus = "\xC2\xB1";

// Boolean env-flag parser shared by every UDEC_* toggle.
inline bool parse_env_flag_value(const char* raw, bool fallback) {
  if (!raw || *raw == '\0') {
    return fallback;
  }
  const std::string value(raw);
  if (value == "0" || value == "false" || value == "False" || value == "off" ||
      value == "OFF" || value == "no" || value == "NO") {
    return false;
  }
  return true;
}

inline bool env_flag_enabled(const char* name, bool fallback) {
  return parse_env_flag_value(std::getenv(name), fallback);
}

bool trace_enabled();
void trace_result(std::string_view stage, const std::string& input, const UncertainValue& result);
std::string format_pair(const Decimal& value, const Decimal& uncertainty);

// Enforces the one-digit uncertainty / aligned value form. Every producing
// operation ends here.
UncertainValue canonicalize(const Decimal& value, const Decimal& uncertainty);

} // namespace udec
