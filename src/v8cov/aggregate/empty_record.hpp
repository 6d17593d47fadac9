#pragma once

#include <cstdint>
#include <string>

#include "v8cov/convert/source_text.hpp"
#include "v8cov/core/result.hpp"
#include "v8cov/istanbul/coverage_map.hpp"
#include "v8cov/istanbul/file_coverage.hpp"

namespace v8cov::aggregate {

// name of the function entry fabricated for files that never ran
inline constexpr const char* k_empty_function_name = "(empty-report)";

/**
 * coverage of a file no process loaded: every line a statement with count 0, plus one
 * zero branch and one zero function so reporters show 0% rather than an empty 100%.
 */
istanbul::file_coverage make_zero_coverage(const std::string& path, const convert::source_text& text);

/**
 * loads the file the way a script is loaded and zeroes every file it reports under.
 *
 * a file carrying a sourceMappingURL yields one zero record per original source; any
 * other file yields a single record keyed by its own path.
 */
result<istanbul::coverage_map> load_zero_coverage(const std::string& path, uint32_t wrapper_length = 0);

} // namespace v8cov::aggregate
