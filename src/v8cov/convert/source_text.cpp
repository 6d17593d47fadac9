#include "source_text.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <regex>
#include <system_error>

#include "v8cov/util/string_utils.hpp"

namespace v8cov::convert {

namespace {

// counts past the range of uint32_t saturate
uint32_t parse_line_count(const std::string& digits) {
  uint32_t value = 0;
  auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec == std::errc::result_out_of_range) {
    return std::numeric_limits<uint32_t>::max();
  }
  return ec == std::errc() ? value : 0;
}

struct ignore_hint {
  std::optional<uint32_t> next;
  bool start = false;
  bool stop = false;
};

std::optional<ignore_hint> parse_ignore_hint(const std::string& line) {
  if (line.find("ignore") == std::string::npos) {
    return std::nullopt;
  }

  static const std::regex next_count(R"(^\W*/\* (?:[cC]8|v8) ignore next (\d+))");
  static const std::regex next_own_line(R"(^\W*/\* (?:[cC]8|v8) ignore next)");
  static const std::regex next_inline(R"(/\* (?:[cC]8|v8) ignore next)");
  static const std::regex start_stop(R"(/\* (?:[cC]8|v8) ignore (start|stop))");

  std::smatch match;
  ignore_hint hint;
  if (std::regex_search(line, match, next_count)) {
    hint.next = parse_line_count(match[1].str());
    return hint;
  }
  if (std::regex_search(line, next_own_line)) {
    hint.next = 1;
    return hint;
  }
  if (std::regex_search(line, next_inline)) {
    // only the line carrying the comment is ignored
    hint.next = 0;
    return hint;
  }
  if (std::regex_search(line, match, start_stop)) {
    hint.start = match[1].str() == "start";
    hint.stop = !hint.start;
    return hint;
  }
  return std::nullopt;
}

} // namespace

istanbul::location source_line::to_location() const {
  return istanbul::location{{line, 0}, {line, static_cast<uint32_t>(end_col - start_col)}};
}

source_text::source_text(std::string_view text) : raw_(text) {
  int64_t position = 0;
  uint32_t ignore_count = 0;
  bool ignore_all = false;

  size_t begin = 0;
  uint32_t number = 1;
  for (;;) {
    size_t newline = text.find('\n', begin);
    size_t next = newline == std::string_view::npos ? text.size() : newline + 1;
    std::string_view chunk = text.substr(begin, next - begin);

    size_t terminator = 0;
    if (util::ends_with(chunk, "\r\n")) {
      terminator = 2;
    } else if (util::ends_with(chunk, "\n")) {
      terminator = 1;
    }

    int64_t length = static_cast<int64_t>(util::utf16_length(chunk));
    source_line line;
    line.line = number++;
    line.start_col = position;
    line.end_col = position + length - static_cast<int64_t>(terminator);

    if (ignore_count > 0) {
      line.ignore = true;
      --ignore_count;
    } else if (ignore_all) {
      line.ignore = true;
    }

    std::string content(chunk);
    if (auto hint = parse_ignore_hint(content)) {
      line.ignore = true;
      if (hint->next) {
        ignore_count = *hint->next;
      }
      if (hint->start || hint->stop) {
        ignore_all = hint->start;
        ignore_count = 0;
      }
    }

    lines_.push_back(line);
    position += length;

    if (newline == std::string_view::npos || next >= text.size()) {
      break;
    }
    begin = next;
  }

  eof_ = position;
}

std::pair<size_t, size_t> source_text::overlapping(int64_t start, int64_t end) const {
  auto first = std::lower_bound(lines_.begin(), lines_.end(), start, [](const source_line& line, int64_t value) {
    return line.end_col < value;
  });
  auto last = first;
  while (last != lines_.end() && last->start_col <= end) {
    ++last;
  }
  return {static_cast<size_t>(first - lines_.begin()), static_cast<size_t>(last - lines_.begin())};
}

const source_line* source_text::line_at(uint32_t line) const {
  if (line == 0 || line > lines_.size()) {
    return nullptr;
  }
  return &lines_[line - 1];
}

int64_t source_text::offset_of(uint32_t line, int64_t column) const {
  const source_line* entry = line_at(line);
  if (entry == nullptr) {
    return line == 0 ? 0 : eof_;
  }
  return std::clamp(entry->start_col + column, entry->start_col, entry->end_col);
}

std::string make_placeholder_source(const std::vector<uint32_t>& line_lengths) {
  std::string source;
  for (uint32_t length : line_lengths) {
    source.append(length, '.');
    source.push_back('\n');
  }
  return source;
}

std::optional<std::string> find_source_mapping_url(std::string_view text) {
  static constexpr std::string_view k_markers[] = {"//# sourceMappingURL=", "//@ sourceMappingURL="};

  size_t best = std::string_view::npos;
  size_t marker_size = 0;
  for (auto marker : k_markers) {
    size_t found = text.rfind(marker);
    if (found != std::string_view::npos && (best == std::string_view::npos || found > best)) {
      best = found;
      marker_size = marker.size();
    }
  }
  if (best == std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view rest = text.substr(best + marker_size);
  size_t end = rest.find_first_of(" \t\r\n");
  std::string url(rest.substr(0, end));
  if (url.empty()) {
    return std::nullopt;
  }
  return url;
}

} // namespace v8cov::convert
