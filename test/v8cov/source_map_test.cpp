#include <doctest/doctest.h>

#include "test_helpers.hpp"
#include "v8cov/convert/source_map.hpp"
#include "v8cov/util/base64.hpp"

using namespace v8cov;

TEST_CASE("decode_mappings reads vlq segments") {
  auto decoded = convert::decode_mappings("AAAA,EAAE,CAAD;AACA");
  REQUIRE(decoded.ok());
  const auto& segments = decoded.value;
  REQUIRE(segments.size() == 4);

  CHECK(segments[0].generated_line == 1);
  CHECK(segments[0].generated_column == 0);
  CHECK(segments[0].source == 0);
  CHECK(segments[0].original_line == 1);

  CHECK(segments[1].generated_column == 2);
  CHECK(segments[1].original_column == 2);

  CHECK(segments[2].generated_column == 3);
  CHECK(segments[2].original_column == 1);

  CHECK(segments[3].generated_line == 2);
  CHECK(segments[3].generated_column == 0);
  CHECK(segments[3].original_line == 2);
  CHECK(segments[3].original_column == 1);

  auto unmapped = convert::decode_mappings("A");
  REQUIRE(unmapped.ok());
  REQUIRE(unmapped.value.size() == 1);
  CHECK(unmapped.value[0].source == -1);

  CHECK(convert::decode_mappings("A!AA").status.code == error_code::parse_error);
  CHECK(convert::decode_mappings("AA").status.code == error_code::parse_error);
  CHECK(convert::decode_mappings("g").status.code == error_code::parse_error);
}

TEST_CASE("source_map parse validates the document") {
  nlohmann::json data = {
      {"version", 3}, {"sources", {"a.ts"}}, {"sourcesContent", {"let a;"}}, {"mappings", "AAAA"}
  };
  auto map = convert::source_map::parse(data);
  REQUIRE(map.ok());
  CHECK(map.value.sources() == std::vector<std::string>{"a.ts"});
  CHECK(map.value.source_content(0) == std::optional<std::string>("let a;"));
  CHECK_FALSE(map.value.source_content(1).has_value());

  CHECK(convert::source_map::parse(nlohmann::json::array()).status.code == error_code::invalid_format);
  CHECK(convert::source_map::parse({{"version", 3}, {"sources", {"a"}}}).status.code == error_code::invalid_format);
  CHECK(convert::source_map::parse({{"version", 2}, {"mappings", ""}}).status.code == error_code::unsupported);
  CHECK(
      convert::source_map::parse({{"version", 3}, {"sections", nlohmann::json::array()}}).status.code ==
      error_code::unsupported
  );
  CHECK(
      convert::source_map::parse({{"version", 3}, {"sources", {"a"}}, {"mappings", "ACAA"}}).status.code ==
      error_code::invalid_format
  );
}

TEST_CASE("original_position_for uses lower then upper bounds on the same line") {
  nlohmann::json data = {{"version", 3}, {"sources", {"a.ts"}}, {"mappings", "AAAA,IAAI;AACA"}};
  auto map = convert::source_map::parse(data);
  REQUIRE(map.ok());

  auto lower = map.value.original_position_for(1, 6);
  REQUIRE(lower.has_value());
  CHECK(lower->line == 1);
  CHECK(lower->column == 6);

  auto upper = map.value.original_position_for(1, 2, convert::lookup_bias::least_upper_bound);
  REQUIRE(upper.has_value());
  CHECK(upper->column == 4);

  auto second = map.value.original_position_for(2, 0);
  REQUIRE(second.has_value());
  CHECK(second->line == 2);

  CHECK_FALSE(map.value.original_position_for(3, 0).has_value());
  CHECK_FALSE(map.value.original_position_for(1, 9, convert::lookup_bias::least_upper_bound).has_value());
}

TEST_CASE("resolve_source_path handles roots, urls and bundler prefixes") {
  CHECK(convert::resolve_source_path("/p/dist/a.js", "", "../src/a.ts") == "/p/src/a.ts");
  CHECK(convert::resolve_source_path("/p/dist/a.js", "src", "x.ts") == "/p/dist/src/x.ts");
  CHECK(convert::resolve_source_path("/p/dist/a.js", "file:///p/lib", "x.ts") == "/p/lib/x.ts");
  CHECK(convert::resolve_source_path("/p/dist/a.js", "", "file:///abs/a.ts") == "/abs/a.ts");
  CHECK(convert::resolve_source_path("/p/dist/a.js", "", "webpack:///src/a.ts") == "/src/a.ts");
}

TEST_CASE("load_referenced_source_map reads inline and sibling maps") {
  auto inline_map = convert::load_referenced_source_map(
      "/p/a.js", "data:application/json;charset=utf-8;base64,eyJ2ZXJzaW9uIjozLCJzb3VyY2VzIjpbIm9yaWcudHMiXSwic291cmNlc0Nv"
                 "bnRlbnQiOlsiLy8gaGVhZGVyXG5sZXQgYSA9IDE7XG5sZXQgYiA9IDI7XG4iXSwibWFwcGluZ3MiOiJBQUNBO0FBQ0EifQ=="
  );
  REQUIRE(inline_map.ok());
  CHECK(inline_map.value["sources"][0] == "orig.ts");
  CHECK(inline_map.value["mappings"] == "AACA;AACA");

  CHECK(convert::load_referenced_source_map("/p/a.js", "data:application/json,{}").status.code == error_code::unsupported);

  test_helpers::temp_dir dir("sibling_map");
  dir.write("dist/a.js.map", R"({"version":3,"sources":[],"mappings":""})");
  auto sibling = convert::load_referenced_source_map(dir.file("dist/a.js"), "a.js.map");
  REQUIRE(sibling.ok());
  CHECK(sibling.value["version"] == 3);

  CHECK(convert::load_referenced_source_map(dir.file("dist/a.js"), "missing.map").status.code == error_code::not_found);

  dir.write("dist/broken.map", "{");
  CHECK(convert::load_referenced_source_map(dir.file("dist/a.js"), "broken.map").status.code == error_code::parse_error);
}

TEST_CASE("base64_decode") {
  CHECK(util::base64_decode("aGVsbG8gd29ybGQ=") == std::optional<std::string>("hello world"));
  CHECK(util::base64_decode("") == std::optional<std::string>(""));
  CHECK_FALSE(util::base64_decode("a*b").has_value());
}
