#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <redlog.hpp>

namespace v8cov::aggregate {

struct watermark {
  double low = 50.0;
  double high = 80.0;
};

struct watermarks {
  watermark statements;
  watermark functions;
  watermark branches;
  watermark lines;
};

/**
 * settings of one report run.
 *
 * load_from_environment() reads V8COV_* variables over the defaults; command line flags
 * are applied on top by the caller.
 */
struct report_config {
  std::string temp_directory = "coverage/tmp";
  std::string reports_directory = "coverage";
  // empty means the current directory
  std::string resolve_root;

  std::vector<std::string> include;
  std::vector<std::string> exclude;
  std::vector<std::string> extensions;
  bool exclude_node_modules = true;

  std::vector<std::string> reporters = {"text-summary"};
  aggregate::watermarks watermarks;

  bool omit_relative = true;
  bool all = false;
  uint32_t wrapper_length = 0;

  report_config();

  void load_from_environment();
  bool validate(std::string& error) const;
  void log_config(const redlog::logger& log) const;

  // resolve_root, or the current directory when unset
  std::string effective_resolve_root() const;
};

const std::vector<std::string>& known_reporters();

} // namespace v8cov::aggregate
