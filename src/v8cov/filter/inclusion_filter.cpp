#include "inclusion_filter.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "v8cov/path/file_url.hpp"
#include "v8cov/util/file_utils.hpp"
#include "v8cov/util/string_utils.hpp"

namespace v8cov::filter {

namespace {

// "src" also covers "src/**", and "**/x" also covers a top level "x"
std::vector<std::string> prepare_patterns(const std::vector<std::string>& patterns) {
  std::vector<std::string> prepared;
  for (const auto& pattern : patterns) {
    if (!util::ends_with(pattern, "/**")) {
      std::string base = pattern;
      while (!base.empty() && base.back() == '/') {
        base.pop_back();
      }
      prepared.push_back(base + "/**");
    }
    if (util::starts_with(pattern, "**/")) {
      prepared.push_back(pattern.substr(3));
    }
    prepared.push_back(pattern);
  }
  return prepared;
}

std::string strip_dot_prefix(std::string value) {
  if (util::starts_with(value, "./")) {
    value.erase(0, 2);
  }
  return value;
}

} // namespace

std::vector<std::string> default_exclude_patterns() {
  return {
      "coverage/**",
      "packages/*/test{,s}/**",
      "**/*.d.ts",
      "test{,s}/**",
      "test{,-*}.{js,cjs,mjs,ts,tsx,jsx}",
      "**/*{.,-}test.{js,cjs,mjs,ts,tsx,jsx}",
      "**/__tests__/**",
      "**/{ava,babel,nyc}.config.{js,cjs,mjs}",
      "**/jest.config.{js,cjs,mjs,ts}",
      "**/{karma,rollup,webpack}.config.js",
      "**/.{eslint,mocha}rc.{js,cjs}",
  };
}

std::vector<std::string> default_extensions() { return {".js", ".cjs", ".mjs", ".ts", ".tsx", ".jsx"}; }

glob_inclusion_filter::glob_inclusion_filter(inclusion_rules rules)
    : rules_(std::move(rules)), log_(redlog::get_logger("v8cov.filter")) {
  if (rules_.cwd.empty()) {
    std::error_code ec;
    rules_.cwd = std::filesystem::current_path(ec).generic_string();
  }
  rules_.cwd = path::resolve_path(rules_.cwd, ".");

  std::vector<std::string> exclude = rules_.exclude;
  if (rules_.exclude_node_modules &&
      std::find(exclude.begin(), exclude.end(), "**/node_modules/**") == exclude.end()) {
    exclude.push_back("**/node_modules/**");
  }

  std::vector<std::string> positive;
  std::vector<std::string> negated;
  for (const auto& pattern : exclude) {
    if (util::starts_with(pattern, "!")) {
      negated.push_back(pattern.substr(1));
    } else {
      positive.push_back(pattern);
    }
  }

  for (const auto& pattern : prepare_patterns(rules_.include)) {
    include_.emplace_back(pattern);
  }
  for (const auto& pattern : prepare_patterns(positive)) {
    exclude_.emplace_back(pattern);
  }
  for (const auto& pattern : prepare_patterns(negated)) {
    exclude_negated_.emplace_back(pattern);
  }

  log_.dbg(
      "inclusion filter ready", redlog::field("cwd", rules_.cwd), redlog::field("include", include_.size()),
      redlog::field("exclude", exclude_.size()), redlog::field("extensions", rules_.extensions.size())
  );
}

bool glob_inclusion_filter::matches_any(const std::vector<glob_pattern>& patterns, const std::string& path) const {
  return std::any_of(patterns.begin(), patterns.end(), [&](const glob_pattern& pattern) {
    return pattern.matches(path);
  });
}

bool glob_inclusion_filter::has_extension(const std::string& path) const {
  if (rules_.extensions.empty()) {
    return true;
  }
  return std::any_of(rules_.extensions.begin(), rules_.extensions.end(), [&](const std::string& extension) {
    return util::ends_with(path, extension);
  });
}

bool glob_inclusion_filter::should_instrument(const std::string& path) const {
  if (!has_extension(path)) {
    return false;
  }

  std::string to_check = path;
  if (rules_.relative_path) {
    std::string relative = path::relative_path(rules_.cwd, path::resolve_path(rules_.cwd, path));
    if (util::starts_with(relative, "..")) {
      return false;
    }
    to_check = strip_dot_prefix(relative);
  }

  bool included = include_.empty() || matches_any(include_, to_check);
  if (!included) {
    return false;
  }
  return !matches_any(exclude_, to_check) || matches_any(exclude_negated_, to_check);
}

std::vector<std::string> glob_inclusion_filter::glob(const std::string& root) const {
  namespace fs = std::filesystem;

  std::string base = path::resolve_path(rules_.cwd, root);
  std::vector<std::string> files;

  std::error_code ec;
  fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    log_.wrn("cannot list directory", redlog::field("root", base), redlog::field("error", ec.message()));
    return files;
  }

  status walked = util::walk_directory(std::move(it), [&](fs::recursive_directory_iterator& entry) {
    std::error_code type_ec;
    if (entry->is_directory(type_ec)) {
      if (rules_.exclude_node_modules && entry->path().filename() == "node_modules") {
        entry.disable_recursion_pending();
      }
      return;
    }
    if (!entry->is_regular_file(type_ec)) {
      return;
    }

    std::string file = path::resolve_path(base, entry->path().generic_string());
    if (should_instrument(file)) {
      files.push_back(std::move(file));
    }
  });
  if (!walked.ok()) {
    log_.wrn("directory walk interrupted", redlog::field("root", base), redlog::field("error", walked.message));
  }

  std::sort(files.begin(), files.end());
  log_.vrb("discovered files", redlog::field("root", base), redlog::field("count", files.size()));
  return files;
}

std::unique_ptr<inclusion_filter> make_inclusion_filter(inclusion_rules rules) {
  return std::make_unique<glob_inclusion_filter>(std::move(rules));
}

} // namespace v8cov::filter
