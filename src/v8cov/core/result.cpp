#include "result.hpp"

namespace v8cov {

const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::invalid_config:
    return "invalid_config";
  case error_code::not_found:
    return "not_found";
  case error_code::io_error:
    return "io_error";
  case error_code::parse_error:
    return "parse_error";
  case error_code::invalid_format:
    return "invalid_format";
  case error_code::invalid_url:
    return "invalid_url";
  case error_code::unsupported:
    return "unsupported";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

} // namespace v8cov
