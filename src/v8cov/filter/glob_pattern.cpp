#include "glob_pattern.hpp"

namespace v8cov::filter {

namespace {

std::vector<std::string> split_segments(std::string_view value) {
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= value.size()) {
    size_t end = value.find('/', start);
    if (end == std::string_view::npos) {
      end = value.size();
    }
    std::string_view segment = value.substr(start, end - start);
    // "a//b" and "./a" collapse to their meaningful segments
    if (!segment.empty() && segment != ".") {
      segments.emplace_back(segment);
    }
    start = end + 1;
  }
  return segments;
}

bool match_class(std::string_view pattern, size_t& index, char ch) {
  // index points just past '['
  size_t i = index;
  bool negate = false;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    negate = true;
    ++i;
  }

  bool matched = false;
  bool first = true;
  while (i < pattern.size() && (first || pattern[i] != ']')) {
    first = false;
    char low = pattern[i];
    if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
      char high = pattern[i + 2];
      if (ch >= low && ch <= high) {
        matched = true;
      }
      i += 3;
      continue;
    }
    if (ch == low) {
      matched = true;
    }
    ++i;
  }

  if (i >= pattern.size()) {
    // unterminated class: treat '[' literally
    index = std::string_view::npos;
    return false;
  }
  index = i + 1;
  return matched != negate;
}

bool match_segments(
    const std::vector<std::string>& pattern, size_t pattern_index, const std::vector<std::string>& path,
    size_t path_index
) {
  while (pattern_index < pattern.size()) {
    const std::string& part = pattern[pattern_index];
    if (part == "**") {
      // collapse consecutive globstars
      while (pattern_index + 1 < pattern.size() && pattern[pattern_index + 1] == "**") {
        ++pattern_index;
      }
      if (pattern_index + 1 == pattern.size()) {
        return true;
      }
      for (size_t skip = path_index; skip <= path.size(); ++skip) {
        if (match_segments(pattern, pattern_index + 1, path, skip)) {
          return true;
        }
      }
      return false;
    }
    if (path_index >= path.size() || !match_segment(part, path[path_index])) {
      return false;
    }
    ++pattern_index;
    ++path_index;
  }
  return path_index == path.size();
}

} // namespace

std::vector<std::string> expand_braces(std::string_view pattern) {
  size_t open = std::string_view::npos;
  int depth = 0;
  for (size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] == '{') {
      if (depth == 0) {
        open = i;
      }
      ++depth;
    } else if (pattern[i] == '}' && depth > 0) {
      --depth;
      if (depth != 0) {
        continue;
      }

      std::string_view prefix = pattern.substr(0, open);
      std::string_view body = pattern.substr(open + 1, i - open - 1);
      std::string_view suffix = pattern.substr(i + 1);

      std::vector<std::string_view> options;
      int nested = 0;
      size_t option_start = 0;
      for (size_t j = 0; j < body.size(); ++j) {
        if (body[j] == '{') {
          ++nested;
        } else if (body[j] == '}') {
          --nested;
        } else if (body[j] == ',' && nested == 0) {
          options.push_back(body.substr(option_start, j - option_start));
          option_start = j + 1;
        }
      }
      options.push_back(body.substr(option_start));

      if (options.size() < 2) {
        // "{a}" is literal in minimatch
        continue;
      }

      std::vector<std::string> expanded;
      for (auto option : options) {
        std::string candidate;
        candidate.append(prefix);
        candidate.append(option);
        candidate.append(suffix);
        for (auto& item : expand_braces(candidate)) {
          expanded.push_back(std::move(item));
        }
      }
      return expanded;
    }
  }
  return {std::string(pattern)};
}

bool match_segment(std::string_view pattern, std::string_view segment) {
  size_t p = 0;
  size_t s = 0;
  size_t star_p = std::string_view::npos;
  size_t star_s = 0;

  while (s < segment.size()) {
    if (p < pattern.size()) {
      char pc = pattern[p];
      if (pc == '*') {
        star_p = p++;
        star_s = s;
        continue;
      }
      if (pc == '?') {
        ++p;
        ++s;
        continue;
      }
      if (pc == '[') {
        size_t next = p + 1;
        bool matched = match_class(pattern, next, segment[s]);
        if (next != std::string_view::npos) {
          if (matched) {
            p = next;
            ++s;
            continue;
          }
        } else if (segment[s] == '[') {
          ++p;
          ++s;
          continue;
        }
      } else if (pc == '\\' && p + 1 < pattern.size()) {
        if (pattern[p + 1] == segment[s]) {
          p += 2;
          ++s;
          continue;
        }
      } else if (pc == segment[s]) {
        ++p;
        ++s;
        continue;
      }
    }

    if (star_p == std::string_view::npos) {
      return false;
    }
    p = star_p + 1;
    s = ++star_s;
  }

  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

glob_pattern::glob_pattern(std::string_view pattern) : source_(pattern) {
  for (const auto& alternative : expand_braces(pattern)) {
    alternatives_.push_back(split_segments(alternative));
  }
}

bool glob_pattern::matches(std::string_view path) const {
  std::vector<std::string> segments = split_segments(path);
  for (const auto& alternative : alternatives_) {
    if (match_segments(alternative, 0, segments, 0)) {
      return true;
    }
  }
  return false;
}

} // namespace v8cov::filter
