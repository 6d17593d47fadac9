#pragma once

#include <vector>

#include "process_coverage.hpp"

namespace v8cov::profile {

/**
 * sums process coverages.
 *
 * scripts are matched by url and functions by their root range; block ranges are merged
 * with merge_range_trees. cjs/esm bridges are classified per input and merged only with
 * bridges of the same url, so a bridge stays a separate entry after its real module. the
 * output is canonical: scripts sorted by url (real module before bridge) with their index
 * as script id, functions sorted by root range, ranges normalized. merging is commutative
 * and associative, and a single input is only normalized.
 */
process_coverage merge_process_coverages(const std::vector<process_coverage>& coverages);

// merges scripts sharing a url; the result takes the first script's id and url
script_coverage merge_script_coverages(const std::vector<const script_coverage*>& scripts);

// merges functions sharing a root range; is_block_coverage is set when any input has it
function_coverage merge_function_coverages(const std::vector<const function_coverage*>& functions);

} // namespace v8cov::profile
