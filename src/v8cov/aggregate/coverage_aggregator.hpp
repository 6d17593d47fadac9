#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "report_config.hpp"
#include "source_map_registry.hpp"
#include "v8cov/core/result.hpp"
#include "v8cov/filter/inclusion_filter.hpp"
#include "v8cov/istanbul/coverage_map.hpp"
#include "v8cov/profile/dump_loader.hpp"
#include "v8cov/profile/process_coverage.hpp"

namespace v8cov::aggregate {

// path -> whether some script resolved to it; only used in all-files mode
using seen_files = std::map<std::string, bool>;

struct conversion_options {
  std::string resolve_root;
  uint32_t wrapper_length = 0;
};

/**
 * converts merged scripts into one coverage map.
 *
 * scripts are resolved against the resolve root and applied in order. cjs/esm bridge
 * scripts are held back and applied only for paths no other script covered. scripts that
 * fail to load or convert are logged and skipped. when seen is given, every path a script
 * resolves to is flagged in it.
 */
istanbul::coverage_map convert_scripts(
    const std::vector<profile::script_coverage>& scripts, const conversion_options& options,
    const source_map_registry& source_maps, seen_files* seen, const redlog::logger& log
);

// merges zero records for every unseen file; files that fail to load are logged and skipped
void fill_unseen_files(
    const seen_files& seen, const conversion_options& options, istanbul::coverage_map& map, const redlog::logger& log
);

/**
 * turns the dumps of a test run into a single istanbul coverage map.
 *
 * loading, normalization, merging, conversion and all-files zero filling run once; the
 * resulting map is cached and shared with every later caller. failures are not cached.
 */
class coverage_aggregator {
public:
  coverage_aggregator(
      report_config config, std::shared_ptr<const filter::inclusion_filter> filter,
      std::shared_ptr<profile::dump_loader> loader
  );

  result<std::shared_ptr<const istanbul::coverage_map>> coverage_map();

  const report_config& config() const { return config_; }

private:
  result<std::shared_ptr<const istanbul::coverage_map>> build();

  report_config config_;
  std::shared_ptr<const filter::inclusion_filter> filter_;
  std::shared_ptr<profile::dump_loader> loader_;
  std::shared_ptr<const istanbul::coverage_map> cached_;
  redlog::logger log_;
};

// filter built from the config's include/exclude rules
std::shared_ptr<const filter::inclusion_filter> make_config_filter(const report_config& config);

} // namespace v8cov::aggregate
