#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "v8cov/core/result.hpp"

namespace v8cov::istanbul {

// line is 1-based, column 0-based
struct position {
  uint32_t line = 0;
  uint32_t column = 0;

  auto operator<=>(const position& other) const = default;
};

struct location {
  position start;
  position end;

  auto operator<=>(const location& other) const = default;
};

struct statement_entry {
  location loc;
  int64_t count = 0;

  bool operator==(const statement_entry& other) const = default;
};

struct function_entry {
  std::string name;
  location decl;
  location loc;
  uint32_t line = 0;
  int64_t count = 0;

  bool operator==(const function_entry& other) const = default;
};

struct branch_entry {
  std::string type = "branch";
  uint32_t line = 0;
  location loc;
  std::vector<location> locations;
  // one count per location
  std::vector<int64_t> counts;

  bool operator==(const branch_entry& other) const = default;
};

/**
 * line based coverage of one file in istanbul's shape.
 *
 * entries are identified by source location. merging sums the counts of entries at the
 * same location (branches element-wise), appends the others and leaves every list
 * ordered by location, so merge order does not matter.
 */
class file_coverage {
public:
  file_coverage() = default;
  explicit file_coverage(std::string path);

  const std::string& path() const { return path_; }

  void add_statement(const location& loc, int64_t count);
  void add_function(function_entry function);
  void add_branch(branch_entry branch);

  const std::vector<statement_entry>& statements() const { return statements_; }
  const std::vector<function_entry>& functions() const { return functions_; }
  const std::vector<branch_entry>& branches() const { return branches_; }

  void merge(const file_coverage& other);

  bool operator==(const file_coverage& other) const = default;

private:
  std::string path_;
  std::vector<statement_entry> statements_;
  std::vector<function_entry> functions_;
  std::vector<branch_entry> branches_;
};

nlohmann::json to_json(const location& loc);
nlohmann::json to_json(const file_coverage& coverage);

result<file_coverage> file_coverage_from_json(const nlohmann::json& node);

} // namespace v8cov::istanbul
