#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "v8cov/core/result.hpp"

namespace v8cov::profile {

// offsets are utf-16 code units into the script source as v8 saw it
struct coverage_range {
  int64_t start_offset = 0;
  int64_t end_offset = 0;
  int64_t count = 0;

  bool operator==(const coverage_range& other) const = default;
};

struct function_coverage {
  std::string function_name;
  // ranges[0] is the function's own range; block ranges follow in pre-order
  std::vector<coverage_range> ranges;
  bool is_block_coverage = false;

  bool operator==(const function_coverage& other) const = default;
};

struct script_coverage {
  std::string script_id;
  std::string url;
  std::vector<function_coverage> functions;

  bool operator==(const script_coverage& other) const = default;
};

struct process_coverage {
  std::vector<script_coverage> result;

  bool operator==(const process_coverage& other) const = default;
};

struct source_map_entry {
  // the raw source map; null when the runtime could not capture it
  nlohmann::json data;
  std::optional<std::vector<uint32_t>> line_lengths;
};

// source-map-cache contents keyed as the runtime wrote them (file:// urls)
using source_map_cache = std::map<std::string, source_map_entry>;

// one validated dump file
struct process_dump {
  std::string origin;
  process_coverage coverage;
  source_map_cache source_maps;
};

/**
 * validates and converts a parsed dump document.
 *
 * the document must be an object with a "result" array; every script needs a string
 * "url" and a "functions" array, every range numeric offsets and count. "scriptId",
 * "functionName" and "isBlockCoverage" are optional. an optional "source-map-cache"
 * object is captured as-is.
 */
result<process_dump> process_dump_from_json(const nlohmann::json& document, std::string origin);

// parses dump text; json syntax errors are reported as error_code::parse_error
result<process_dump> parse_process_dump(std::string_view text, std::string origin);

nlohmann::json to_json(const process_coverage& coverage);

} // namespace v8cov::profile
