#pragma once

#include <cstdint>

#include "coverage_map.hpp"

namespace v8cov::istanbul {

struct coverage_metric {
  uint64_t total = 0;
  uint64_t covered = 0;

  // 100 when there is nothing to cover, matching istanbul
  double percent() const;
};

struct coverage_summary {
  coverage_metric statements;
  coverage_metric branches;
  coverage_metric functions;
  coverage_metric lines;

  void add(const coverage_summary& other);
};

// lines are derived from statements: a line counts the highest hit count starting on it
coverage_summary summarize(const file_coverage& file);
coverage_summary summarize(const coverage_map& map);

} // namespace v8cov::istanbul
