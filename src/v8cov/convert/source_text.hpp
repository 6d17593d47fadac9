#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "v8cov/istanbul/file_coverage.hpp"

namespace v8cov::convert {

struct source_line {
  uint32_t line = 0;
  // absolute utf-16 offsets within the file; end excludes the line terminator
  int64_t start_col = 0;
  int64_t end_col = 0;
  // every line starts out executed and is zeroed by uncovered ranges
  int64_t count = 1;
  bool ignore = false;

  istanbul::location to_location() const;
};

/**
 * line table of a script.
 *
 * offsets are utf-16 code units so they line up with the offsets v8 reports. lines
 * carrying c8/v8 ignore hints ("ignore next [n]", "ignore start"/"ignore stop") are
 * flagged as ignored.
 */
class source_text {
public:
  source_text() = default;
  explicit source_text(std::string_view text);

  const std::vector<source_line>& lines() const { return lines_; }
  std::vector<source_line>& lines() { return lines_; }

  // total length in utf-16 code units
  int64_t eof() const { return eof_; }

  const std::string& raw() const { return raw_; }

  // indices of lines touching [start, end], i.e. start <= line.end_col && end >= line.start_col
  std::pair<size_t, size_t> overlapping(int64_t start, int64_t end) const;

  // 1-based line lookup
  const source_line* line_at(uint32_t line) const;

  // offset of a 1-based line and 0-based column, clamped to the line
  int64_t offset_of(uint32_t line, int64_t column) const;

private:
  std::string raw_;
  std::vector<source_line> lines_;
  int64_t eof_ = 0;
};

// stand-in source with one line of dots per recorded length
std::string make_placeholder_source(const std::vector<uint32_t>& line_lengths);

// url named by the last sourceMappingURL comment, if any
std::optional<std::string> find_source_mapping_url(std::string_view text);

} // namespace v8cov::convert
