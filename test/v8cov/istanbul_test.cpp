#include <doctest/doctest.h>

#include "v8cov/istanbul/coverage_map.hpp"
#include "v8cov/istanbul/coverage_summary.hpp"
#include "v8cov/istanbul/file_coverage.hpp"

using namespace v8cov;

namespace {

istanbul::location line_loc(uint32_t line, uint32_t length) { return {{line, 0}, {line, length}}; }

istanbul::branch_entry branch(uint32_t line, std::vector<int64_t> counts) {
  istanbul::branch_entry entry;
  entry.line = line;
  entry.loc = line_loc(line, 5);
  for (size_t i = 0; i < counts.size(); ++i) {
    entry.locations.push_back({{line, static_cast<uint32_t>(i)}, {line, 5}});
  }
  entry.counts = std::move(counts);
  return entry;
}

istanbul::function_entry function(std::string name, uint32_t line, int64_t count) {
  istanbul::function_entry entry;
  entry.name = std::move(name);
  entry.decl = line_loc(line, 10);
  entry.loc = entry.decl;
  entry.line = line;
  entry.count = count;
  return entry;
}

istanbul::file_coverage sample_a() {
  istanbul::file_coverage file("/p/a.js");
  file.add_statement(line_loc(1, 10), 1);
  file.add_statement(line_loc(2, 4), 0);
  file.add_function(function("foo", 1, 1));
  file.add_branch(branch(1, {1, 0}));
  return file;
}

istanbul::file_coverage sample_b() {
  istanbul::file_coverage file("/p/a.js");
  file.add_statement(line_loc(2, 4), 3);
  file.add_statement(line_loc(3, 2), 1);
  file.add_function(function("foo", 1, 2));
  file.add_function(function("bar", 3, 0));
  file.add_branch(branch(1, {0, 4}));
  return file;
}

} // namespace

TEST_CASE("file_coverage merge sums entries at the same location") {
  auto merged = sample_a();
  merged.merge(sample_b());

  REQUIRE(merged.statements().size() == 3);
  CHECK(merged.statements()[0].count == 1);
  CHECK(merged.statements()[1].count == 3);
  CHECK(merged.statements()[2].count == 1);

  REQUIRE(merged.functions().size() == 2);
  CHECK(merged.functions()[0].name == "foo");
  CHECK(merged.functions()[0].count == 3);
  CHECK(merged.functions()[1].name == "bar");

  REQUIRE(merged.branches().size() == 1);
  CHECK(merged.branches()[0].counts == std::vector<int64_t>{1, 4});
}

TEST_CASE("file_coverage merge is order independent") {
  auto left = sample_a();
  left.merge(sample_b());
  auto right = sample_b();
  right.merge(sample_a());
  CHECK(left == right);
}

TEST_CASE("add_branch pads missing counts") {
  istanbul::file_coverage file("/p/a.js");
  auto entry = branch(1, {});
  entry.locations.push_back(line_loc(1, 1));
  file.add_branch(entry);
  REQUIRE(file.branches().size() == 1);
  CHECK(file.branches()[0].counts == std::vector<int64_t>{0});
}

TEST_CASE("file coverage serializes to istanbul json") {
  auto json = istanbul::to_json(sample_a());
  CHECK(json["path"] == "/p/a.js");
  CHECK(json["statementMap"]["1"]["start"]["line"] == 2);
  CHECK(json["statementMap"]["1"]["end"]["column"] == 4);
  CHECK(json["s"]["0"] == 1);
  CHECK(json["s"]["1"] == 0);
  CHECK(json["fnMap"]["0"]["name"] == "foo");
  CHECK(json["f"]["0"] == 1);
  CHECK(json["branchMap"]["0"]["type"] == "branch");
  CHECK(json["branchMap"]["0"]["locations"].size() == 2);
  CHECK(json["b"]["0"] == nlohmann::json::array({1, 0}));
}

TEST_CASE("coverage_map merges by path and reads istanbul documents") {
  istanbul::coverage_map map;
  map.merge(sample_a());
  map.merge(sample_b());
  istanbul::file_coverage other("/p/b.js");
  other.add_statement(line_loc(1, 1), 0);
  map.merge(other);

  CHECK(map.size() == 2);
  REQUIRE(map.find("/p/a.js") != nullptr);
  CHECK(map.find("/p/a.js")->statements().size() == 3);
  CHECK(map.contains("/p/b.js"));
  CHECK(map.find("/p/missing.js") == nullptr);

  auto document = istanbul::to_json(map);
  auto reread = istanbul::coverage_map_from_json(document);
  REQUIRE(reread.ok());
  CHECK(reread.value == map);

  auto wrapped = istanbul::coverage_map_from_json(nlohmann::json{{"/p/b.js", {{"data", istanbul::to_json(other)}}}});
  REQUIRE(wrapped.ok());
  CHECK(wrapped.value.contains("/p/b.js"));

  CHECK_FALSE(istanbul::coverage_map_from_json(nlohmann::json::array()).ok());
}

TEST_CASE("coverage summary counts covered entries") {
  istanbul::coverage_map map;
  map.merge(sample_a());

  auto summary = istanbul::summarize(map);
  CHECK(summary.statements.total == 2);
  CHECK(summary.statements.covered == 1);
  CHECK(summary.lines.total == 2);
  CHECK(summary.lines.covered == 1);
  CHECK(summary.functions.total == 1);
  CHECK(summary.functions.covered == 1);
  CHECK(summary.branches.total == 2);
  CHECK(summary.branches.covered == 1);
  CHECK(summary.statements.percent() == doctest::Approx(50.0));

  istanbul::coverage_metric thirds{3, 2};
  CHECK(thirds.percent() == doctest::Approx(66.66));

  istanbul::coverage_metric empty;
  CHECK(empty.percent() == doctest::Approx(100.0));
}
