#pragma once

#include <redlog.hpp>

#include "process_coverage.hpp"
#include "v8cov/filter/inclusion_filter.hpp"

namespace v8cov::profile {

struct normalize_options {
  // drop scripts whose path is not absolute after url conversion
  bool omit_relative = true;
};

/**
 * rewrites file:// script urls to system paths and keeps only the scripts the filter
 * accepts. a url that cannot be converted drops only that script, with a warning.
 * surviving scripts keep their original order.
 */
process_coverage normalize_process_coverage(
    process_coverage coverage, const filter::inclusion_filter& filter, const normalize_options& options,
    const redlog::logger& log
);

} // namespace v8cov::profile
