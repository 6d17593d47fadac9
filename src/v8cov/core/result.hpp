#pragma once

#include <string>
#include <utility>

namespace v8cov {

// error codes shared by every component
enum class error_code {
  ok,
  invalid_argument,
  invalid_config,
  not_found,
  io_error,
  parse_error,
  invalid_format,
  invalid_url,
  unsupported,
  internal_error
};

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  v8cov::status status{};

  bool ok() const noexcept { return status.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(status error) { return result<T>{T{}, std::move(error)}; }

const char* error_code_name(error_code code) noexcept;

} // namespace v8cov
