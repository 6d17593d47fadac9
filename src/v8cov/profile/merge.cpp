#include "merge.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <utility>

#include "cjs_esm_bridge.hpp"
#include "range_tree.hpp"

namespace v8cov::profile {

namespace {

using root_key = std::pair<int64_t, int64_t>;

struct root_order {
  bool operator()(const root_key& left, const root_key& right) const {
    if (left.first != right.first) {
      return left.first < right.first;
    }
    return left.second > right.second;
  }
};

std::vector<coverage_range> sorted_ranges(const function_coverage& function) {
  std::vector<coverage_range> ranges = function.ranges;
  std::stable_sort(ranges.begin(), ranges.end(), range_precedes);
  return ranges;
}

} // namespace

function_coverage merge_function_coverages(const std::vector<const function_coverage*>& functions) {
  function_coverage merged;
  if (functions.empty()) {
    return merged;
  }

  std::vector<range_node> trees;
  trees.reserve(functions.size());
  for (const function_coverage* function : functions) {
    if (!function->function_name.empty() &&
        (merged.function_name.empty() || function->function_name < merged.function_name)) {
      merged.function_name = function->function_name;
    }
    merged.is_block_coverage = merged.is_block_coverage || function->is_block_coverage;

    std::optional<range_node> tree = build_range_tree(sorted_ranges(*function));
    if (tree) {
      trees.push_back(std::move(*tree));
    }
  }
  if (trees.empty()) {
    return merged;
  }

  std::vector<const range_node*> inputs;
  inputs.reserve(trees.size());
  for (const auto& tree : trees) {
    inputs.push_back(&tree);
  }

  range_node sum = merge_range_trees(inputs);
  normalize_range_tree(sum);
  merged.ranges = flatten_range_tree(sum);
  return merged;
}

script_coverage merge_script_coverages(const std::vector<const script_coverage*>& scripts) {
  script_coverage merged;
  if (scripts.empty()) {
    return merged;
  }
  merged.script_id = scripts.front()->script_id;
  merged.url = scripts.front()->url;

  std::map<root_key, std::vector<const function_coverage*>, root_order> by_root;
  for (const script_coverage* script : scripts) {
    for (const auto& function : script->functions) {
      if (function.ranges.empty()) {
        continue;
      }
      const coverage_range& root = *std::min_element(function.ranges.begin(), function.ranges.end(), range_precedes);
      by_root[root_key{root.start_offset, root.end_offset}].push_back(&function);
    }
  }

  merged.functions.reserve(by_root.size());
  for (const auto& [root, functions] : by_root) {
    merged.functions.push_back(merge_function_coverages(functions));
  }
  return merged;
}

process_coverage merge_process_coverages(const std::vector<process_coverage>& coverages) {
  // bridges share their module's url but only ever merge with other bridges
  std::map<std::pair<std::string, bool>, std::vector<const script_coverage*>> by_url;
  for (const auto& coverage : coverages) {
    for (const auto& script : coverage.result) {
      by_url[{script.url, is_cjs_esm_bridge(script)}].push_back(&script);
    }
  }

  process_coverage merged;
  merged.result.reserve(by_url.size());
  for (const auto& [key, scripts] : by_url) {
    script_coverage script = merge_script_coverages(scripts);
    script.script_id = std::to_string(merged.result.size());
    merged.result.push_back(std::move(script));
  }
  return merged;
}

} // namespace v8cov::profile
