#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace v8cov::util {

inline std::string to_lower(std::string_view value) {
  std::string out(value.begin(), value.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

inline std::string_view trim_view(std::string_view value) {
  size_t first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  size_t last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

inline std::string trim_copy(std::string_view value) {
  std::string_view trimmed = trim_view(value);
  return std::string(trimmed.begin(), trimmed.end());
}

inline bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// splits on delimiter, trims each item and drops empty ones
inline std::vector<std::string> split_list(std::string_view value, char delimiter = ',') {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find(delimiter, start);
    if (end == std::string_view::npos) {
      end = value.size();
    }
    std::string item = trim_copy(value.substr(start, end - start));
    if (!item.empty()) {
      items.push_back(std::move(item));
    }
    start = end + 1;
  }
  return items;
}

// number of utf-16 code units needed to encode a utf-8 string; v8 reports offsets in these units
inline size_t utf16_length(std::string_view utf8) {
  size_t units = 0;
  for (size_t i = 0; i < utf8.size(); ++i) {
    auto ch = static_cast<unsigned char>(utf8[i]);
    if ((ch & 0xC0) == 0x80) {
      continue;
    }
    units += (ch >= 0xF0) ? 2 : 1;
  }
  return units;
}

} // namespace v8cov::util
