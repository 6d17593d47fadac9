#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "v8cov/core/result.hpp"

namespace v8cov::convert {

struct mapping_segment {
  // 1-based lines, 0-based columns
  uint32_t generated_line = 0;
  uint32_t generated_column = 0;
  int32_t source = -1;
  uint32_t original_line = 0;
  uint32_t original_column = 0;
};

struct original_position {
  size_t source = 0;
  uint32_t line = 0;
  uint32_t column = 0;
};

enum class lookup_bias { greatest_lower_bound, least_upper_bound };

// decodes one base64 vlq-encoded mappings string into segments sorted by generated position
result<std::vector<mapping_segment>> decode_mappings(const std::string& mappings);

/**
 * revision 3 source map.
 *
 * only the flat form is supported; index maps with "sections" are rejected.
 */
class source_map {
public:
  static result<source_map> parse(const nlohmann::json& data);

  const std::vector<std::string>& sources() const { return sources_; }
  const std::string& source_root() const { return source_root_; }
  const std::vector<mapping_segment>& segments() const { return segments_; }

  // embedded content for a source, when present
  std::optional<std::string> source_content(size_t index) const;

  // position in the original source for a generated line (1-based) and column (0-based);
  // the column is shifted by the distance from the matched segment
  std::optional<original_position> original_position_for(
      uint32_t line, uint32_t column, lookup_bias bias = lookup_bias::greatest_lower_bound
  ) const;

private:
  std::vector<std::string> sources_;
  std::vector<std::optional<std::string>> sources_content_;
  std::string source_root_;
  std::vector<mapping_segment> segments_;
};

// filesystem path of an original source named by a map attached to generated_path
std::string resolve_source_path(const std::string& generated_path, const std::string& source_root, const std::string& source);

// json of a map referenced by a sourceMappingURL: inline base64 data urls or files next to the script
result<nlohmann::json> load_referenced_source_map(const std::string& generated_path, const std::string& url);

} // namespace v8cov::convert
