#include "source_map.hpp"

#include <algorithm>
#include <tuple>

#include "v8cov/path/file_url.hpp"
#include "v8cov/util/base64.hpp"
#include "v8cov/util/file_utils.hpp"
#include "v8cov/util/string_utils.hpp"

namespace v8cov::convert {

namespace {

bool decode_vlq(const std::string& text, size_t& pos, int64_t& value) {
  int64_t accumulated = 0;
  int shift = 0;
  for (;;) {
    if (pos >= text.size() || shift > 60) {
      return false;
    }
    int digit = util::base64_digit(text[pos++]);
    if (digit < 0) {
      return false;
    }
    accumulated += static_cast<int64_t>(digit & 31) << shift;
    shift += 5;
    if ((digit & 32) == 0) {
      break;
    }
  }
  bool negative = (accumulated & 1) != 0;
  accumulated >>= 1;
  value = negative ? -accumulated : accumulated;
  return true;
}

bool segment_less(const mapping_segment& a, const mapping_segment& b) {
  return std::tie(a.generated_line, a.generated_column) < std::tie(b.generated_line, b.generated_column);
}

} // namespace

result<std::vector<mapping_segment>> decode_mappings(const std::string& mappings) {
  std::vector<mapping_segment> segments;

  uint32_t line = 1;
  int64_t generated_column = 0;
  int64_t source = 0;
  int64_t original_line = 0;
  int64_t original_column = 0;
  int64_t name = 0;

  size_t pos = 0;
  while (pos < mappings.size()) {
    char ch = mappings[pos];
    if (ch == ';') {
      ++line;
      generated_column = 0;
      ++pos;
      continue;
    }
    if (ch == ',') {
      ++pos;
      continue;
    }

    int64_t fields[5] = {0, 0, 0, 0, 0};
    int count = 0;
    while (pos < mappings.size() && mappings[pos] != ',' && mappings[pos] != ';') {
      if (count == 5 || !decode_vlq(mappings, pos, fields[count])) {
        return error_result<std::vector<mapping_segment>>(
            error_code::parse_error, "malformed vlq segment on generated line " + std::to_string(line)
        );
      }
      ++count;
    }
    if (count != 1 && count != 4 && count != 5) {
      return error_result<std::vector<mapping_segment>>(
          error_code::parse_error, "segment with " + std::to_string(count) + " fields on line " + std::to_string(line)
      );
    }

    generated_column += fields[0];
    mapping_segment segment;
    segment.generated_line = line;
    segment.generated_column = static_cast<uint32_t>(std::max<int64_t>(0, generated_column));
    if (count >= 4) {
      source += fields[1];
      original_line += fields[2];
      original_column += fields[3];
      if (source < 0 || original_line < 0 || original_column < 0) {
        return error_result<std::vector<mapping_segment>>(
            error_code::parse_error, "negative position in mappings on line " + std::to_string(line)
        );
      }
      segment.source = static_cast<int32_t>(source);
      segment.original_line = static_cast<uint32_t>(original_line + 1);
      segment.original_column = static_cast<uint32_t>(original_column);
    }
    if (count == 5) {
      name += fields[4];
    }
    segments.push_back(segment);
  }

  std::stable_sort(segments.begin(), segments.end(), segment_less);
  return ok_result(std::move(segments));
}

result<source_map> source_map::parse(const nlohmann::json& data) {
  if (!data.is_object()) {
    return error_result<source_map>(error_code::invalid_format, "source map must be an object");
  }
  if (data.contains("sections")) {
    return error_result<source_map>(error_code::unsupported, "indexed source maps are not supported");
  }
  if (data.contains("version") && data["version"] != 3) {
    return error_result<source_map>(error_code::unsupported, "unsupported source map version " + data["version"].dump());
  }
  if (!data.contains("mappings") || !data["mappings"].is_string()) {
    return error_result<source_map>(error_code::invalid_format, "source map has no mappings");
  }

  source_map map;
  if (data.contains("sourceRoot") && data["sourceRoot"].is_string()) {
    map.source_root_ = data["sourceRoot"].get<std::string>();
  }

  if (data.contains("sources")) {
    if (!data["sources"].is_array()) {
      return error_result<source_map>(error_code::invalid_format, "sources must be an array");
    }
    for (const auto& source : data["sources"]) {
      map.sources_.push_back(source.is_string() ? source.get<std::string>() : std::string());
    }
  }

  map.sources_content_.resize(map.sources_.size());
  if (data.contains("sourcesContent") && data["sourcesContent"].is_array()) {
    const auto& contents = data["sourcesContent"];
    for (size_t i = 0; i < contents.size() && i < map.sources_.size(); ++i) {
      if (contents[i].is_string()) {
        map.sources_content_[i] = contents[i].get<std::string>();
      }
    }
  }

  auto decoded = decode_mappings(data["mappings"].get<std::string>());
  if (!decoded.ok()) {
    return error_result<source_map>(decoded.status);
  }
  for (const auto& segment : decoded.value) {
    if (segment.source >= static_cast<int32_t>(map.sources_.size())) {
      return error_result<source_map>(
          error_code::invalid_format, "mapping references unknown source " + std::to_string(segment.source)
      );
    }
  }
  map.segments_ = std::move(decoded.value);
  return ok_result(std::move(map));
}

std::optional<std::string> source_map::source_content(size_t index) const {
  if (index >= sources_content_.size()) {
    return std::nullopt;
  }
  return sources_content_[index];
}

std::optional<original_position> source_map::original_position_for(
    uint32_t line, uint32_t column, lookup_bias bias
) const {
  mapping_segment needle;
  needle.generated_line = line;
  needle.generated_column = column;

  const mapping_segment* match = nullptr;
  if (bias == lookup_bias::greatest_lower_bound) {
    auto it = std::upper_bound(segments_.begin(), segments_.end(), needle, segment_less);
    if (it != segments_.begin()) {
      --it;
      if (it->generated_line == line) {
        match = &*it;
      }
    }
  } else {
    auto it = std::lower_bound(segments_.begin(), segments_.end(), needle, segment_less);
    if (it != segments_.end() && it->generated_line == line) {
      match = &*it;
    }
  }

  if (match == nullptr || match->source < 0) {
    return std::nullopt;
  }

  original_position position;
  position.source = static_cast<size_t>(match->source);
  position.line = match->original_line;
  position.column = match->original_column;
  if (column > match->generated_column) {
    position.column += column - match->generated_column;
  }
  return position;
}

std::string resolve_source_path(
    const std::string& generated_path, const std::string& source_root, const std::string& source
) {
  std::string name = source;
  if (path::is_file_url(name)) {
    auto converted = path::file_url_to_path(name);
    if (converted.ok()) {
      return path::resolve_path("/", converted.value);
    }
  }
  if (util::starts_with(name, "webpack://")) {
    name = name.substr(std::string("webpack://").size());
  }

  std::string root = source_root;
  if (util::starts_with(root, "file://")) {
    root = root.substr(std::string("file://").size());
  }

  std::string joined = root.empty() ? name : root + "/" + name;
  return path::resolve_path(path::parent_directory(generated_path), joined);
}

result<nlohmann::json> load_referenced_source_map(const std::string& generated_path, const std::string& url) {
  std::string text;
  if (util::starts_with(url, "data:")) {
    size_t comma = url.find(',');
    if (comma == std::string::npos || url.substr(0, comma).find(";base64") == std::string::npos) {
      return error_result<nlohmann::json>(error_code::unsupported, "only base64 data urls are supported");
    }
    auto decoded = util::base64_decode(std::string_view(url).substr(comma + 1));
    if (!decoded) {
      return error_result<nlohmann::json>(error_code::parse_error, "invalid base64 in inline source map");
    }
    text = std::move(*decoded);
  } else {
    std::string map_path;
    if (path::is_file_url(url)) {
      auto converted = path::file_url_to_path(url);
      if (!converted.ok()) {
        return error_result<nlohmann::json>(converted.status);
      }
      map_path = converted.value;
    } else {
      map_path = path::resolve_path(path::parent_directory(generated_path), url);
    }
    auto contents = util::read_text_file(map_path);
    if (!contents.ok()) {
      return error_result<nlohmann::json>(contents.status);
    }
    text = std::move(contents.value);
  }

  try {
    return ok_result(nlohmann::json::parse(text));
  } catch (const nlohmann::json::parse_error& e) {
    return error_result<nlohmann::json>(error_code::parse_error, e.what());
  }
}

} // namespace v8cov::convert
