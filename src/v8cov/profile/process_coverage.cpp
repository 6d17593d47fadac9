#include "process_coverage.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace v8cov::profile {

namespace {

status field_error(const std::string& where, const std::string& what) {
  return make_status(error_code::invalid_format, where + ": " + what);
}

// false when the number does not fit an int64_t
bool read_integer(const nlohmann::json& node, int64_t& out) {
  if (node.is_number_float()) {
    double value = node.get<double>();
    // 2^63 is exactly representable and is the first value past int64_t
    constexpr double k_limit = 9223372036854775808.0;
    if (!std::isfinite(value) || value < -k_limit || value >= k_limit) {
      return false;
    }
    out = static_cast<int64_t>(value);
    return true;
  }
  if (node.is_number_unsigned()) {
    uint64_t value = node.get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return false;
    }
    out = static_cast<int64_t>(value);
    return true;
  }
  out = node.get<int64_t>();
  return true;
}

status read_range(const nlohmann::json& node, const std::string& where, coverage_range& out) {
  if (!node.is_object()) {
    return field_error(where, "range is not an object");
  }
  static constexpr const char* k_keys[] = {"startOffset", "endOffset", "count"};
  int64_t values[3] = {0, 0, 0};
  for (size_t i = 0; i < 3; ++i) {
    auto it = node.find(k_keys[i]);
    if (it == node.end() || !it->is_number()) {
      return field_error(where, std::string("missing numeric ") + k_keys[i]);
    }
    if (!read_integer(*it, values[i])) {
      return field_error(where, std::string(k_keys[i]) + " is out of range");
    }
  }
  if (values[1] < values[0]) {
    return field_error(where, "range ends before it starts");
  }
  out.start_offset = values[0];
  out.end_offset = values[1];
  out.count = values[2];
  return ok_status();
}

status read_function(const nlohmann::json& node, const std::string& where, function_coverage& out) {
  if (!node.is_object()) {
    return field_error(where, "function is not an object");
  }

  if (auto name = node.find("functionName"); name != node.end()) {
    if (!name->is_string()) {
      return field_error(where, "functionName is not a string");
    }
    out.function_name = name->get<std::string>();
  }
  if (auto block = node.find("isBlockCoverage"); block != node.end()) {
    if (!block->is_boolean()) {
      return field_error(where, "isBlockCoverage is not a boolean");
    }
    out.is_block_coverage = block->get<bool>();
  }

  auto ranges = node.find("ranges");
  if (ranges == node.end() || !ranges->is_array()) {
    return field_error(where, "missing ranges array");
  }
  out.ranges.reserve(ranges->size());
  for (size_t i = 0; i < ranges->size(); ++i) {
    coverage_range range;
    status st = read_range((*ranges)[i], where + ".ranges[" + std::to_string(i) + "]", range);
    if (!st.ok()) {
      return st;
    }
    out.ranges.push_back(range);
  }
  return ok_status();
}

status read_script(const nlohmann::json& node, const std::string& where, script_coverage& out) {
  if (!node.is_object()) {
    return field_error(where, "script is not an object");
  }

  auto url = node.find("url");
  if (url == node.end() || !url->is_string()) {
    return field_error(where, "missing string url");
  }
  out.url = url->get<std::string>();

  if (auto id = node.find("scriptId"); id != node.end()) {
    if (id->is_string()) {
      out.script_id = id->get<std::string>();
    } else if (id->is_number_integer()) {
      out.script_id = std::to_string(id->get<int64_t>());
    }
  }

  auto functions = node.find("functions");
  if (functions == node.end() || !functions->is_array()) {
    return field_error(where, "missing functions array");
  }
  out.functions.reserve(functions->size());
  for (size_t i = 0; i < functions->size(); ++i) {
    function_coverage function;
    status st = read_function((*functions)[i], where + ".functions[" + std::to_string(i) + "]", function);
    if (!st.ok()) {
      return st;
    }
    out.functions.push_back(std::move(function));
  }
  return ok_status();
}

status read_source_map_cache(const nlohmann::json& node, source_map_cache& out) {
  if (!node.is_object()) {
    return field_error("source-map-cache", "not an object");
  }
  for (const auto& item : node.items()) {
    const std::string& key = item.key();
    const nlohmann::json& value = item.value();
    if (!value.is_object()) {
      return field_error("source-map-cache[" + key + "]", "entry is not an object");
    }
    source_map_entry entry;
    if (auto data = value.find("data"); data != value.end()) {
      entry.data = *data;
    }
    if (auto lengths = value.find("lineLengths"); lengths != value.end() && !lengths->is_null()) {
      if (!lengths->is_array()) {
        return field_error("source-map-cache[" + key + "]", "lineLengths is not an array");
      }
      std::vector<uint32_t> values;
      values.reserve(lengths->size());
      for (const auto& length : *lengths) {
        if (!length.is_number_unsigned() && !length.is_number_integer()) {
          return field_error("source-map-cache[" + key + "]", "lineLengths holds a non-integer");
        }
        int64_t value_length = length.get<int64_t>();
        values.push_back(value_length < 0 ? 0u : static_cast<uint32_t>(value_length));
      }
      entry.line_lengths = std::move(values);
    }
    out[key] = std::move(entry);
  }
  return ok_status();
}

} // namespace

result<process_dump> process_dump_from_json(const nlohmann::json& document, std::string origin) {
  if (!document.is_object()) {
    return error_result<process_dump>(error_code::invalid_format, "dump is not a json object");
  }

  auto scripts = document.find("result");
  if (scripts == document.end() || !scripts->is_array()) {
    return error_result<process_dump>(error_code::invalid_format, "dump has no result array");
  }

  process_dump dump;
  dump.origin = std::move(origin);
  dump.coverage.result.reserve(scripts->size());
  for (size_t i = 0; i < scripts->size(); ++i) {
    script_coverage script;
    status st = read_script((*scripts)[i], "result[" + std::to_string(i) + "]", script);
    if (!st.ok()) {
      return error_result<process_dump>(std::move(st));
    }
    dump.coverage.result.push_back(std::move(script));
  }

  if (auto cache = document.find("source-map-cache"); cache != document.end() && !cache->is_null()) {
    status st = read_source_map_cache(*cache, dump.source_maps);
    if (!st.ok()) {
      return error_result<process_dump>(std::move(st));
    }
  }

  return ok_result(std::move(dump));
}

result<process_dump> parse_process_dump(std::string_view text, std::string origin) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error& e) {
    return error_result<process_dump>(error_code::parse_error, e.what());
  }
  return process_dump_from_json(document, std::move(origin));
}

nlohmann::json to_json(const process_coverage& coverage) {
  nlohmann::json scripts = nlohmann::json::array();
  for (const auto& script : coverage.result) {
    nlohmann::json functions = nlohmann::json::array();
    for (const auto& function : script.functions) {
      nlohmann::json ranges = nlohmann::json::array();
      for (const auto& range : function.ranges) {
        ranges.push_back({{"startOffset", range.start_offset}, {"endOffset", range.end_offset}, {"count", range.count}});
      }
      functions.push_back(
          {{"functionName", function.function_name},
           {"ranges", std::move(ranges)},
           {"isBlockCoverage", function.is_block_coverage}}
      );
    }
    scripts.push_back({{"scriptId", script.script_id}, {"url", script.url}, {"functions", std::move(functions)}});
  }
  return nlohmann::json{{"result", std::move(scripts)}};
}

} // namespace v8cov::profile
