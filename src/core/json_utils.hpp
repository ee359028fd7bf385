#ifndef CAMLINK_CORE_JSON_UTILS_HPP_
#define CAMLINK_CORE_JSON_UTILS_HPP_

#include <cstdio>
#include <string>
#include <string_view>

namespace camlink::core {

// Escapes `input` for use inside a JSON string literal (quotes not added).
inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size() + 8U);
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char escaped[8];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x",
                      static_cast<unsigned int>(static_cast<unsigned char>(ch)));
        out += escaped;
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  return out;
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

} // namespace camlink::core

#endif // CAMLINK_CORE_JSON_UTILS_HPP_
