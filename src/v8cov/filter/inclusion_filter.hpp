#pragma once

#include <memory>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "glob_pattern.hpp"

namespace v8cov::filter {

// decides which script paths take part in a report
class inclusion_filter {
public:
  virtual ~inclusion_filter() = default;

  virtual bool should_instrument(const std::string& path) const = 0;

  // every file under root the filter accepts, as sorted absolute paths
  virtual std::vector<std::string> glob(const std::string& root) const = 0;
};

struct inclusion_rules {
  std::string cwd;
  std::vector<std::string> include;
  std::vector<std::string> exclude;
  std::vector<std::string> extensions;
  bool exclude_node_modules = true;
  // when set, paths are matched relative to cwd and files outside cwd are rejected
  bool relative_path = true;
};

std::vector<std::string> default_exclude_patterns();
std::vector<std::string> default_extensions();

/**
 * include/exclude glob rules compatible with the test-exclude conventions used by
 * node coverage tooling.
 *
 * a path is accepted when it carries one of the extensions, lies under cwd, matches an
 * include pattern (or no include patterns were given) and either matches no exclude
 * pattern or matches a negated ("!pattern") exclude.
 */
class glob_inclusion_filter final : public inclusion_filter {
public:
  explicit glob_inclusion_filter(inclusion_rules rules);

  bool should_instrument(const std::string& path) const override;
  std::vector<std::string> glob(const std::string& root) const override;

  const inclusion_rules& rules() const { return rules_; }

private:
  inclusion_rules rules_;
  std::vector<glob_pattern> include_;
  std::vector<glob_pattern> exclude_;
  std::vector<glob_pattern> exclude_negated_;
  redlog::logger log_;

  bool matches_any(const std::vector<glob_pattern>& patterns, const std::string& path) const;
  bool has_extension(const std::string& path) const;
};

std::unique_ptr<inclusion_filter> make_inclusion_filter(inclusion_rules rules);

} // namespace v8cov::filter
