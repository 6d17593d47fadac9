#pragma once

#include <string>
#include <system_error>

#include "v8cov/core/result.hpp"

namespace v8cov::util {

// reads a whole file as bytes; not_found when it does not exist, io_error otherwise
result<std::string> read_text_file(const std::string& path);

status write_text_file(const std::string& path, const std::string& contents);

/**
 * walks a std::filesystem directory iterator, calling visit(it) on every position.
 *
 * a failed increment moves the iterator to its end, so the error is checked after every
 * step and reported as io_error instead of ending the walk as if it had finished.
 */
template <typename Iterator, typename Visit> status walk_directory(Iterator it, Visit&& visit) {
  std::error_code ec;
  for (Iterator end; it != end;) {
    visit(it);
    it.increment(ec);
    if (ec) {
      return make_status(error_code::io_error, ec.message());
    }
  }
  return ok_status();
}

} // namespace v8cov::util
