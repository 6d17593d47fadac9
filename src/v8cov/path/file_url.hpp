#pragma once

#include <string>
#include <string_view>

#include "v8cov/core/result.hpp"

namespace v8cov::path {

bool is_file_url(std::string_view url);

/**
 * converts a file:// url into a system path.
 *
 * the authority must be empty or "localhost" and the path absolute. percent escapes are
 * decoded; escaped separators, escaped nul bytes and malformed escapes are rejected with
 * error_code::invalid_url.
 */
result<std::string> file_url_to_path(std::string_view url);

// inverse of file_url_to_path for absolute paths; used by tests and source map keys
std::string path_to_file_url(std::string_view path);

bool is_absolute(std::string_view path);

/**
 * resolves a path against root the way a shell would: absolute paths are kept, relative
 * ones are joined to root, and the result is lexically normalized without trailing separator.
 */
std::string resolve_path(std::string_view root, std::string_view path);

// path of target relative to root, using forward slashes
std::string relative_path(std::string_view root, std::string_view target);

std::string parent_directory(std::string_view path);

} // namespace v8cov::path
