#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "v8cov/profile/dump_loader.hpp"
#include "v8cov/profile/process_coverage.hpp"

namespace v8cov::test_helpers {

// fresh directory under the system temp path, removed on destruction
class temp_dir {
public:
  explicit temp_dir(const std::string& name) {
    std::random_device device;
    path_ = std::filesystem::temp_directory_path() / ("v8cov_" + name + "_" + std::to_string(device()));
    std::filesystem::create_directories(path_);
    // canonical so paths compare equal to what the code under test resolves
    path_ = std::filesystem::canonical(path_);
  }

  ~temp_dir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.generic_string(); }

  std::string file(const std::string& relative) const { return (path_ / relative).generic_string(); }

  std::string write(const std::string& relative, const std::string& contents) const {
    std::filesystem::path target = path_ / relative;
    std::filesystem::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary);
    out << contents;
    return target.generic_string();
  }

private:
  std::filesystem::path path_;
};

inline profile::coverage_range range(int64_t start, int64_t end, int64_t count) {
  return profile::coverage_range{start, end, count};
}

inline profile::function_coverage function(
    std::string name, std::vector<profile::coverage_range> ranges, bool is_block_coverage = true
) {
  profile::function_coverage out;
  out.function_name = std::move(name);
  out.ranges = std::move(ranges);
  out.is_block_coverage = is_block_coverage;
  return out;
}

inline profile::script_coverage script(std::string url, std::vector<profile::function_coverage> functions) {
  profile::script_coverage out;
  out.script_id = "0";
  out.url = std::move(url);
  out.functions = std::move(functions);
  return out;
}

// the three functions node emits for the module that lets esm import commonjs
inline profile::script_coverage bridge_script(std::string url, int64_t length) {
  return script(
      std::move(url), {function("", {range(0, length, 1)}, true), function("get", {range(0, 10, 0)}, false),
                       function("set", {range(10, 20, 0)}, false)}
  );
}

inline profile::process_dump dump(std::vector<profile::script_coverage> scripts, std::string origin = "memory") {
  profile::process_dump out;
  out.origin = std::move(origin);
  out.coverage.result = std::move(scripts);
  return out;
}

// in-memory loader recording how often it was asked
class counting_loader final : public profile::dump_loader {
public:
  explicit counting_loader(std::vector<profile::process_dump> dumps) : dumps_(std::move(dumps)) {}

  result<std::vector<profile::process_dump>> load() override {
    ++calls_;
    if (fail_) {
      return error_result<std::vector<profile::process_dump>>(error_code::io_error, "loader failure");
    }
    return ok_result(dumps_);
  }

  size_t calls() const { return calls_; }
  void set_fail(bool fail) { fail_ = fail; }

private:
  std::vector<profile::process_dump> dumps_;
  size_t calls_ = 0;
  bool fail_ = false;
};

} // namespace v8cov::test_helpers
