#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "process_coverage.hpp"

namespace v8cov::profile {

// nested view of a function's ranges; a child's count replaces its parent's inside the child
struct range_node {
  int64_t start = 0;
  int64_t end = 0;
  int64_t count = 0;
  std::vector<range_node> children;
};

// orders ranges by start ascending, then end descending (pre-order of the nesting)
bool range_precedes(const coverage_range& left, const coverage_range& right);

/**
 * builds a tree from ranges sorted with range_precedes. the first range is the root;
 * ranges outside the root are dropped and a range crossing its parent's end is clipped.
 */
std::optional<range_node> build_range_tree(const std::vector<coverage_range>& sorted_ranges);

// count of the deepest node containing [start, end), or the root count
int64_t count_covering(const range_node& tree, int64_t start, int64_t end);

/**
 * sums trees sharing one root extent.
 *
 * the result holds the laminar union of every input range (partially overlapping
 * ranges are split) and each node counts the sum, over inputs, of the input's count
 * covering that node.
 */
range_node merge_range_trees(const std::vector<const range_node*>& trees);

// fuses touching siblings with equal counts and collapses a single child spanning its parent
void normalize_range_tree(range_node& tree);

std::vector<coverage_range> flatten_range_tree(const range_node& tree);

} // namespace v8cov::profile
