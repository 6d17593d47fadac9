#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <redlog.hpp>

#include "source_map.hpp"
#include "source_text.hpp"
#include "v8cov/core/result.hpp"
#include "v8cov/istanbul/coverage_map.hpp"
#include "v8cov/profile/process_coverage.hpp"

namespace v8cov::convert {

// inputs that replace what the converter would otherwise read from disk
struct converter_sources {
  // generated source text; typically a placeholder built from cached line lengths
  std::optional<std::string> source;
  std::optional<nlohmann::json> source_map;
};

/**
 * converts the offset coverage of one script into line based istanbul coverage.
 *
 * usage: construct, load(), apply_coverage() at most once, then to_istanbul(). without a
 * source map the result holds one file keyed by the script path; with one it holds a file
 * per original source.
 */
class script_converter {
public:
  script_converter(std::string path, uint32_t wrapper_length, converter_sources sources = {});

  status load();

  void apply_coverage(const std::vector<profile::function_coverage>& functions);

  istanbul::coverage_map to_istanbul() const;

  const std::string& path() const { return path_; }
  const source_text& generated() const { return generated_; }
  bool has_source_map() const { return map_.has_value(); }

  // files coverage is reported under after load(): the original sources when a source map
  // applies, the script itself otherwise
  std::vector<std::pair<std::string, const source_text*>> reported_sources() const;

private:
  struct covered_span {
    uint32_t start_line = 0;
    uint32_t start_column = 0;
    uint32_t end_line = 0;
    uint32_t end_column = 0;
    int64_t count = 0;

    istanbul::location to_location() const { return {{start_line, start_column}, {end_line, end_column}}; }
  };

  struct covered_function {
    std::string name;
    covered_span span;
  };

  struct covered_file {
    std::string path;
    source_text text;
    std::vector<covered_span> branches;
    std::vector<covered_function> functions;
  };

  struct mapped_range {
    size_t file = 0;
    int64_t start = 0;
    int64_t end = 0;
  };

  status load_source_map(const nlohmann::json& data);
  std::optional<original_position> lookup(uint32_t line, uint32_t column) const;
  std::optional<mapped_range> map_range(int64_t start, int64_t end) const;
  void record_range(
      covered_file& file, int64_t start, int64_t end, const profile::coverage_range& range,
      const profile::function_coverage& function, size_t index
  );

  std::string path_;
  uint32_t wrapper_length_ = 0;
  converter_sources sources_;
  source_text generated_;
  std::optional<source_map> map_;
  std::vector<covered_file> files_;
  redlog::logger log_;
};

} // namespace v8cov::convert
