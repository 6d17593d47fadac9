#include "coverage_summary.hpp"

#include <cmath>
#include <map>

namespace v8cov::istanbul {

namespace {

void add_metric(coverage_metric& into, const coverage_metric& from) {
  into.total += from.total;
  into.covered += from.covered;
}

} // namespace

double coverage_metric::percent() const {
  if (total == 0) {
    return 100.0;
  }
  double raw = 100.0 * static_cast<double>(covered) / static_cast<double>(total);
  return std::floor(raw * 100.0) / 100.0;
}

void coverage_summary::add(const coverage_summary& other) {
  add_metric(statements, other.statements);
  add_metric(branches, other.branches);
  add_metric(functions, other.functions);
  add_metric(lines, other.lines);
}

coverage_summary summarize(const file_coverage& file) {
  coverage_summary summary;

  std::map<uint32_t, int64_t> line_hits;
  for (const auto& statement : file.statements()) {
    ++summary.statements.total;
    if (statement.count > 0) {
      ++summary.statements.covered;
    }
    auto [it, inserted] = line_hits.emplace(statement.loc.start.line, statement.count);
    if (!inserted && it->second < statement.count) {
      it->second = statement.count;
    }
  }
  for (const auto& [line, hits] : line_hits) {
    ++summary.lines.total;
    if (hits > 0) {
      ++summary.lines.covered;
    }
  }

  for (const auto& function : file.functions()) {
    ++summary.functions.total;
    if (function.count > 0) {
      ++summary.functions.covered;
    }
  }

  for (const auto& branch : file.branches()) {
    for (int64_t count : branch.counts) {
      ++summary.branches.total;
      if (count > 0) {
        ++summary.branches.covered;
      }
    }
  }

  return summary;
}

coverage_summary summarize(const coverage_map& map) {
  coverage_summary summary;
  for (const auto& [path, file] : map.files()) {
    summary.add(summarize(file));
  }
  return summary;
}

} // namespace v8cov::istanbul
