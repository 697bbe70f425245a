#ifndef SCOPECAM_CORE_JSON_UTILS_HPP_
#define SCOPECAM_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>

namespace scopecam::core {

// Shared JSON string escaping for stream messages and operation descriptors.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// JSON has no NaN/Inf; those collapse to `null`. Output is locale-independent.
inline std::string FormatJsonNumber(double value, int precision = 6) {
  if (!std::isfinite(value)) {
    return "null";
  }
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::setprecision(precision) << value;
  return out.str();
}

inline std::string JsonString(std::string_view value) {
  return "\"" + EscapeJson(value) + "\"";
}

inline const char* JsonBool(bool value) {
  return value ? "true" : "false";
}

} // namespace scopecam::core

#endif // SCOPECAM_CORE_JSON_UTILS_HPP_
