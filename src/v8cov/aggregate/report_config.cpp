#include "report_config.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "v8cov/filter/inclusion_filter.hpp"
#include "v8cov/util/env_config.hpp"

namespace v8cov::aggregate {

namespace {

bool valid_watermark(const watermark& mark) {
  return mark.low >= 0.0 && mark.high <= 100.0 && mark.low <= mark.high;
}

} // namespace

const std::vector<std::string>& known_reporters() {
  static const std::vector<std::string> reporters = {"json", "text-summary"};
  return reporters;
}

report_config::report_config()
    : exclude(filter::default_exclude_patterns()), extensions(filter::default_extensions()) {}

void report_config::load_from_environment() {
  util::env_config env("V8COV");

  temp_directory = env.get<std::string>("TEMP_DIRECTORY", temp_directory);
  reports_directory = env.get<std::string>("REPORTS_DIRECTORY", reports_directory);
  resolve_root = env.get<std::string>("RESOLVE", resolve_root);

  if (env.has("INCLUDE")) {
    include = env.get_list("INCLUDE");
  }
  if (env.has("EXCLUDE")) {
    exclude = env.get_list("EXCLUDE");
  }
  if (env.has("EXTENSION")) {
    extensions = env.get_list("EXTENSION");
  }
  if (env.has("REPORTER")) {
    reporters = env.get_list("REPORTER");
  }

  exclude_node_modules = env.get<bool>("EXCLUDE_NODE_MODULES", exclude_node_modules);
  omit_relative = env.get<bool>("OMIT_RELATIVE", omit_relative);
  all = env.get<bool>("ALL", all);
  wrapper_length = env.get<uint32_t>("WRAPPER_LENGTH", wrapper_length);
}

bool report_config::validate(std::string& error) const {
  if (temp_directory.empty()) {
    error = "temp directory cannot be empty";
    return false;
  }
  if (reports_directory.empty()) {
    error = "reports directory cannot be empty";
    return false;
  }

  const auto& known = known_reporters();
  for (const auto& reporter : reporters) {
    if (std::find(known.begin(), known.end(), reporter) == known.end()) {
      error = "unknown reporter: " + reporter;
      return false;
    }
  }

  for (const auto* mark : {&watermarks.statements, &watermarks.functions, &watermarks.branches, &watermarks.lines}) {
    if (!valid_watermark(*mark)) {
      error = "watermarks must satisfy 0 <= low <= high <= 100";
      return false;
    }
  }

  return true;
}

void report_config::log_config(const redlog::logger& log) const {
  log.dbg("report configuration");
  log.dbg("  temp directory", redlog::field("path", temp_directory));
  log.dbg("  reports directory", redlog::field("path", reports_directory));
  log.dbg("  resolve root", redlog::field("path", effective_resolve_root()));
  log.dbg(
      "  filters", redlog::field("include", include.size()), redlog::field("exclude", exclude.size()),
      redlog::field("extensions", extensions.size()), redlog::field("exclude_node_modules", exclude_node_modules)
  );
  for (const auto& pattern : include) {
    log.dbg("    include", redlog::field("pattern", pattern));
  }
  for (const auto& reporter : reporters) {
    log.dbg("  reporter", redlog::field("name", reporter));
  }
  log.dbg(
      "  flags", redlog::field("omit_relative", omit_relative), redlog::field("all", all),
      redlog::field("wrapper_length", wrapper_length)
  );
}

std::string report_config::effective_resolve_root() const {
  if (!resolve_root.empty()) {
    return resolve_root;
  }
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  return ec ? std::string(".") : cwd.generic_string();
}

} // namespace v8cov::aggregate
