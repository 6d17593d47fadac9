#pragma once

#include <cstddef>
#include <map>
#include <string>

#include <redlog.hpp>

#include "v8cov/convert/script_converter.hpp"
#include "v8cov/profile/process_coverage.hpp"

namespace v8cov::aggregate {

/**
 * source maps captured by the runtime, keyed by script path.
 *
 * dumps key their caches by file:// url; absorb() converts those keys to paths so they
 * meet the normalized script urls. a later dump overwrites an earlier entry for the same
 * path.
 */
class source_map_registry {
public:
  source_map_registry();

  void absorb(const profile::source_map_cache& cache);

  const profile::source_map_entry* find(const std::string& path) const;

  // converter inputs for a script: the cached map and, with recorded line lengths, a placeholder source
  convert::converter_sources sources_for(const std::string& path) const;

  size_t size() const { return entries_.size(); }

private:
  std::map<std::string, profile::source_map_entry> entries_;
  redlog::logger log_;
};

} // namespace v8cov::aggregate
