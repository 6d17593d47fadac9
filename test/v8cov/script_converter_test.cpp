#include <doctest/doctest.h>

#include "test_helpers.hpp"
#include "v8cov/convert/script_converter.hpp"

using namespace v8cov;
using test_helpers::function;
using test_helpers::range;

namespace {

// lines: [0,16] [17,28] [29,30] [31,37], eof 38
constexpr const char* k_foo_source = "function foo() {\n  return 1;\n}\nfoo();\n";

constexpr const char* k_original_source = "// header\nlet a = 1;\nlet b = 2;\n";

nlohmann::json header_map(bool with_content) {
  nlohmann::json map = {{"version", 3}, {"sources", {"../src/a.ts"}}, {"mappings", "AACA;AACA"}};
  if (with_content) {
    map["sourcesContent"] = {k_original_source};
  }
  return map;
}

std::vector<int64_t> statement_counts(const istanbul::file_coverage& file) {
  std::vector<int64_t> counts;
  for (const auto& statement : file.statements()) {
    counts.push_back(statement.count);
  }
  return counts;
}

} // namespace

TEST_CASE("script_converter maps block coverage onto lines") {
  convert::converter_sources sources;
  sources.source = k_foo_source;
  convert::script_converter converter("/p/foo.js", 0, sources);
  REQUIRE(converter.load().ok());
  CHECK_FALSE(converter.has_source_map());

  converter.apply_coverage({function("", {range(0, 38, 1)}), function("foo", {range(0, 30, 0)})});
  auto map = converter.to_istanbul();
  REQUIRE(map.size() == 1);
  const auto* file = map.find("/p/foo.js");
  REQUIRE(file != nullptr);

  CHECK(statement_counts(*file) == std::vector<int64_t>{0, 0, 0, 1});
  CHECK(file->statements()[0].loc == istanbul::location{{1, 0}, {1, 16}});

  REQUIRE(file->functions().size() == 1);
  CHECK(file->functions()[0].name == "foo");
  CHECK(file->functions()[0].count == 0);
  CHECK(file->functions()[0].loc == istanbul::location{{1, 0}, {3, 1}});
  CHECK(file->functions()[0].line == 1);

  REQUIRE(file->branches().size() == 2);
  CHECK(file->branches()[0].loc == istanbul::location{{1, 0}, {3, 1}});
  CHECK(file->branches()[0].counts == std::vector<int64_t>{0});
  CHECK(file->branches()[1].loc == istanbul::location{{1, 0}, {4, 7}});
  CHECK(file->branches()[1].counts == std::vector<int64_t>{1});
}

TEST_CASE("script_converter subtracts the wrapper length") {
  convert::converter_sources sources;
  sources.source = k_foo_source;
  convert::script_converter converter("/p/foo.js", 10, sources);
  REQUIRE(converter.load().ok());

  converter.apply_coverage({function("", {range(0, 48, 1)}), function("foo", {range(10, 40, 0)})});
  auto map = converter.to_istanbul();
  CHECK(statement_counts(*map.find("/p/foo.js")) == std::vector<int64_t>{0, 0, 0, 1});
}

TEST_CASE("script_converter records named functions without block coverage") {
  convert::converter_sources sources;
  sources.source = k_foo_source;
  convert::script_converter converter("/p/foo.js", 0, sources);
  REQUIRE(converter.load().ok());

  converter.apply_coverage({function("foo", {range(0, 30, 2)}, false), function("", {range(31, 37, 0)}, false)});
  auto map = converter.to_istanbul();
  const auto* file = map.find("/p/foo.js");
  REQUIRE(file != nullptr);
  CHECK(statement_counts(*file) == std::vector<int64_t>{2, 2, 2, 0});
  CHECK(file->branches().empty());
  REQUIRE(file->functions().size() == 1);
  CHECK(file->functions()[0].count == 2);
}

TEST_CASE("script_converter reports ignored lines as covered") {
  // lines: [0,20] [21,39] [40,45], eof 46
  convert::converter_sources sources;
  sources.source = "/* c8 ignore next */\nfunction dead() {}\nok();\n";
  convert::script_converter converter("/p/ignored.js", 0, sources);
  REQUIRE(converter.load().ok());

  converter.apply_coverage({function("", {range(0, 46, 1)}), function("dead", {range(21, 39, 0)})});
  auto map = converter.to_istanbul();
  const auto* file = map.find("/p/ignored.js");
  REQUIRE(file != nullptr);
  CHECK(statement_counts(*file) == std::vector<int64_t>{1, 1, 1});
  REQUIRE(file->functions().size() == 1);
  CHECK(file->functions()[0].count == 1);
  for (const auto& branch : file->branches()) {
    CHECK(branch.counts == std::vector<int64_t>{1});
  }
}

TEST_CASE("script_converter drops ranges outside the source") {
  convert::converter_sources sources;
  sources.source = "a();\n";
  convert::script_converter converter("/p/short.js", 0, sources);
  REQUIRE(converter.load().ok());

  converter.apply_coverage({function("late", {range(100, 200, 0)})});
  auto map = converter.to_istanbul();
  const auto* file = map.find("/p/short.js");
  REQUIRE(file != nullptr);
  CHECK(statement_counts(*file) == std::vector<int64_t>{1});
  CHECK(file->functions().empty());
  CHECK(file->branches().empty());
}

TEST_CASE("script_converter follows a cached source map over a placeholder source") {
  convert::converter_sources sources;
  sources.source = convert::make_placeholder_source({10, 10});
  sources.source_map = header_map(true);
  convert::script_converter converter("/p/dist/a.js", 0, sources);
  REQUIRE(converter.load().ok());
  CHECK(converter.has_source_map());

  // generated lines: [0,10] [11,21], eof 22
  converter.apply_coverage({function("", {range(0, 22, 1), range(11, 21, 0)})});
  auto map = converter.to_istanbul();
  REQUIRE(map.size() == 1);
  const auto* file = map.find("/p/src/a.ts");
  REQUIRE(file != nullptr);

  CHECK(statement_counts(*file) == std::vector<int64_t>{1, 1, 0});
  REQUIRE(file->branches().size() == 2);
  CHECK(file->branches()[0].loc == istanbul::location{{2, 0}, {3, 10}});
  CHECK(file->branches()[0].counts == std::vector<int64_t>{1});
  CHECK(file->branches()[1].loc == istanbul::location{{3, 0}, {3, 10}});
  CHECK(file->branches()[1].counts == std::vector<int64_t>{0});
}

TEST_CASE("script_converter reads inline and sibling source maps from disk") {
  test_helpers::temp_dir dir("converter_maps");
  dir.write("src/a.ts", k_original_source);

  SUBCASE("sibling map file with sources on disk") {
    std::string script = dir.write("dist/a.js", "let a = 1;\nlet b = 2;\n//# sourceMappingURL=a.js.map\n");
    dir.write("dist/a.js.map", header_map(false).dump());

    convert::script_converter converter(script, 0);
    REQUIRE(converter.load().ok());
    CHECK(converter.has_source_map());

    converter.apply_coverage({function("", {range(0, 22, 1)})});
    auto map = converter.to_istanbul();
    CHECK(map.size() == 1);
    CHECK(map.contains(dir.file("src/a.ts")));
  }

  SUBCASE("inline base64 map") {
    std::string script = dir.write(
        "dist/inline.js", "let a = 1;\nlet b = 2;\n//# sourceMappingURL=data:application/json;base64,"
                          "eyJ2ZXJzaW9uIjozLCJzb3VyY2VzIjpbIm9yaWcudHMiXSwic291cmNlc0NvbnRlbnQiOlsiLy8gaGVhZGVyXG5sZXQg"
                          "YSA9IDE7XG5sZXQgYiA9IDI7XG4iXSwibWFwcGluZ3MiOiJBQUNBO0FBQ0EifQ==\n"
    );
    convert::script_converter converter(script, 0);
    REQUIRE(converter.load().ok());
    converter.apply_coverage({function("", {range(0, 22, 1)})});
    CHECK(converter.to_istanbul().contains(dir.file("dist/orig.ts")));
  }

  SUBCASE("unreadable map reference falls back to the generated file") {
    std::string script = dir.write("dist/b.js", "b();\n//# sourceMappingURL=gone.map\n");
    convert::script_converter converter(script, 0);
    REQUIRE(converter.load().ok());
    CHECK_FALSE(converter.has_source_map());
    CHECK(converter.to_istanbul().contains(script));
  }

  SUBCASE("missing original source fails the load") {
    nlohmann::json map = {{"version", 3}, {"sources", {"../src/gone.ts"}}, {"mappings", "AAAA"}};
    convert::converter_sources sources;
    sources.source = "x\n";
    sources.source_map = map;
    convert::script_converter converter(dir.file("dist/c.js"), 0, sources);
    CHECK(converter.load().code == error_code::not_found);
  }
}

TEST_CASE("script_converter fails to load a missing script") {
  convert::script_converter converter("/definitely/not/here.js", 0);
  auto loaded = converter.load();
  CHECK_FALSE(loaded.ok());
  CHECK(loaded.code == error_code::not_found);
}
