#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace v8cov::util {

// value of a standard base64 digit, -1 when the character is not one
inline int base64_digit(char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return ch - 'A';
  }
  if (ch >= 'a' && ch <= 'z') {
    return ch - 'a' + 26;
  }
  if (ch >= '0' && ch <= '9') {
    return ch - '0' + 52;
  }
  if (ch == '+') {
    return 62;
  }
  if (ch == '/') {
    return 63;
  }
  return -1;
}

inline std::optional<std::string> base64_decode(std::string_view encoded) {
  std::string out;
  out.reserve(encoded.size() / 4 * 3);

  uint32_t buffer = 0;
  int bits = 0;
  for (char ch : encoded) {
    if (ch == '=') {
      break;
    }
    if (ch == '\r' || ch == '\n' || ch == ' ') {
      continue;
    }
    int digit = base64_digit(ch);
    if (digit < 0) {
      return std::nullopt;
    }
    buffer = (buffer << 6) | static_cast<uint32_t>(digit);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
    }
  }
  return out;
}

} // namespace v8cov::util
