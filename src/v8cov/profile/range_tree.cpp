#include "range_tree.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace v8cov::profile {

namespace {

struct extent {
  int64_t start;
  int64_t end;
};

struct extent_order {
  bool operator()(const extent& left, const extent& right) const {
    if (left.start != right.start) {
      return left.start < right.start;
    }
    return left.end > right.end;
  }
};

range_node build_subtree(const std::vector<coverage_range>& ranges, size_t& index, int64_t parent_end) {
  const coverage_range& current = ranges[index++];
  range_node node;
  node.start = current.start_offset;
  node.end = std::min(current.end_offset, parent_end);
  node.count = current.count;

  while (index < ranges.size() && ranges[index].start_offset < node.end) {
    node.children.push_back(build_subtree(ranges, index, node.end));
  }
  return node;
}

void collect_extents(const range_node& node, std::set<extent, extent_order>& out) {
  out.insert(extent{node.start, node.end});
  for (const auto& child : node.children) {
    collect_extents(child, out);
  }
}

void flatten_into(const range_node& node, std::vector<coverage_range>& out) {
  out.push_back(coverage_range{node.start, node.end, node.count});
  for (const auto& child : node.children) {
    flatten_into(child, out);
  }
}

} // namespace

bool range_precedes(const coverage_range& left, const coverage_range& right) {
  if (left.start_offset != right.start_offset) {
    return left.start_offset < right.start_offset;
  }
  return left.end_offset > right.end_offset;
}

std::optional<range_node> build_range_tree(const std::vector<coverage_range>& sorted_ranges) {
  if (sorted_ranges.empty()) {
    return std::nullopt;
  }
  size_t index = 0;
  return build_subtree(sorted_ranges, index, sorted_ranges.front().end_offset);
}

int64_t count_covering(const range_node& tree, int64_t start, int64_t end) {
  const range_node* node = &tree;
  for (;;) {
    const range_node* next = nullptr;
    for (const auto& child : node->children) {
      if (child.start <= start && end <= child.end) {
        next = &child;
        break;
      }
      if (child.start > start) {
        break;
      }
    }
    if (next == nullptr) {
      return node->count;
    }
    node = next;
  }
}

range_node merge_range_trees(const std::vector<const range_node*>& trees) {
  range_node merged;
  if (trees.empty()) {
    return merged;
  }

  const range_node& first = *trees.front();
  std::set<extent, extent_order> pending;
  for (const range_node* tree : trees) {
    collect_extents(*tree, pending);
  }

  // make the union laminar: a range crossing an enclosing range's end is split there
  std::vector<coverage_range> laminar;
  std::vector<int64_t> open_ends;
  while (!pending.empty()) {
    extent current = *pending.begin();
    pending.erase(pending.begin());

    while (!open_ends.empty() && current.start >= open_ends.back()) {
      open_ends.pop_back();
    }
    if (open_ends.empty()) {
      if (!laminar.empty() || current.start != first.start || current.end != first.end) {
        continue;
      }
    } else if (current.end > open_ends.back()) {
      int64_t boundary = open_ends.back();
      pending.insert(extent{current.start, boundary});
      pending.insert(extent{boundary, current.end});
      continue;
    }

    laminar.push_back(coverage_range{current.start, current.end, 0});
    open_ends.push_back(current.end);
  }

  for (auto& range : laminar) {
    int64_t total = 0;
    for (const range_node* tree : trees) {
      total += count_covering(*tree, range.start_offset, range.end_offset);
    }
    range.count = total;
  }

  size_t index = 0;
  return build_subtree(laminar, index, first.end);
}

void normalize_range_tree(range_node& tree) {
  std::vector<range_node> children;
  children.reserve(tree.children.size());
  for (auto& child : tree.children) {
    if (!children.empty() && children.back().count == child.count && children.back().end == child.start) {
      range_node& head = children.back();
      head.end = child.end;
      for (auto& grandchild : child.children) {
        head.children.push_back(std::move(grandchild));
      }
      continue;
    }
    children.push_back(std::move(child));
  }

  for (auto& child : children) {
    normalize_range_tree(child);
  }

  if (children.size() == 1 && children.front().start == tree.start && children.front().end == tree.end) {
    tree.count = children.front().count;
    std::vector<range_node> grandchildren = std::move(children.front().children);
    tree.children = std::move(grandchildren);
    return;
  }
  tree.children = std::move(children);
}

std::vector<coverage_range> flatten_range_tree(const range_node& tree) {
  std::vector<coverage_range> ranges;
  flatten_into(tree, ranges);
  return ranges;
}

} // namespace v8cov::profile
