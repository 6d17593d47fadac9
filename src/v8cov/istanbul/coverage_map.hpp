#pragma once

#include <cstddef>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "file_coverage.hpp"
#include "v8cov/core/result.hpp"

namespace v8cov::istanbul {

// absolute path -> file coverage; merging keeps keys unique
class coverage_map {
public:
  using file_table = std::map<std::string, file_coverage>;

  void merge(const file_coverage& file);
  void merge(const coverage_map& other);

  const file_coverage* find(const std::string& path) const;
  bool contains(const std::string& path) const { return files_.count(path) != 0; }

  size_t size() const { return files_.size(); }
  bool empty() const { return files_.empty(); }

  const file_table& files() const { return files_; }

  bool operator==(const coverage_map& other) const = default;

private:
  file_table files_;
};

// istanbul's coverage-final.json document
nlohmann::json to_json(const coverage_map& map);

result<coverage_map> coverage_map_from_json(const nlohmann::json& document);

} // namespace v8cov::istanbul
