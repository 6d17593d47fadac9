#include "file_utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace v8cov::util {

result<std::string> read_text_file(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return error_result<std::string>(error_code::not_found, "no such file: " + path);
  }
  if (std::filesystem::is_directory(path, ec)) {
    return error_result<std::string>(error_code::io_error, "is a directory: " + path);
  }

  std::ifstream input(path, std::ios::in | std::ios::binary);
  if (!input) {
    return error_result<std::string>(error_code::io_error, "failed to open: " + path);
  }

  std::ostringstream contents;
  contents << input.rdbuf();
  if (input.bad()) {
    return error_result<std::string>(error_code::io_error, "failed to read: " + path);
  }
  return ok_result(contents.str());
}

status write_text_file(const std::string& path, const std::string& contents) {
  std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!output) {
    return make_status(error_code::io_error, "failed to open for writing: " + path);
  }
  output << contents;
  output.flush();
  if (!output) {
    return make_status(error_code::io_error, "failed to write: " + path);
  }
  return ok_status();
}

} // namespace v8cov::util
