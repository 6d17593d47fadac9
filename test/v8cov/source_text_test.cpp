#include <doctest/doctest.h>

#include "v8cov/convert/source_text.hpp"

using namespace v8cov;

TEST_CASE("source_text splits lines and measures utf-16 offsets") {
  convert::source_text text("a\nbc\r\nd");
  const auto& lines = text.lines();
  REQUIRE(lines.size() == 3);
  CHECK(lines[0].start_col == 0);
  CHECK(lines[0].end_col == 1);
  CHECK(lines[1].start_col == 2);
  CHECK(lines[1].end_col == 4);
  CHECK(lines[2].start_col == 6);
  CHECK(lines[2].end_col == 7);
  CHECK(text.eof() == 7);
  CHECK(lines[2].line == 3);
  CHECK(lines[0].count == 1);

  convert::source_text trailing("a\n");
  CHECK(trailing.lines().size() == 1);
  CHECK(trailing.eof() == 2);

  convert::source_text empty("");
  REQUIRE(empty.lines().size() == 1);
  CHECK(empty.lines()[0].end_col == 0);

  // two-byte and four-byte utf-8 sequences count as one and two utf-16 units
  convert::source_text wide("\xC3\xA9\n\xF0\x9F\x98\x80x");
  REQUIRE(wide.lines().size() == 2);
  CHECK(wide.lines()[0].end_col == 1);
  CHECK(wide.lines()[1].start_col == 2);
  CHECK(wide.lines()[1].end_col == 5);
}

TEST_CASE("source_text finds overlapping lines and offsets") {
  convert::source_text text("aaaa\nbbbb\ncccc\n");
  auto [first, last] = text.overlapping(6, 12);
  CHECK(first == 1);
  CHECK(last == 3);

  auto [none_first, none_last] = text.overlapping(20, 30);
  CHECK(none_first == none_last);

  CHECK(text.offset_of(2, 1) == 6);
  CHECK(text.offset_of(2, 99) == 9);
  REQUIRE(text.line_at(3) != nullptr);
  CHECK(text.line_at(3)->start_col == 10);
  CHECK(text.line_at(0) == nullptr);
  CHECK(text.line_at(4) == nullptr);
}

TEST_CASE("source_text flags lines covered by ignore hints") {
  SUBCASE("ignore next on its own line") {
    convert::source_text text("a();\n/* c8 ignore next */\nb();\nc();\n");
    const auto& lines = text.lines();
    REQUIRE(lines.size() == 4);
    CHECK_FALSE(lines[0].ignore);
    CHECK(lines[1].ignore);
    CHECK(lines[2].ignore);
    CHECK_FALSE(lines[3].ignore);
  }

  SUBCASE("ignore next with a count") {
    convert::source_text text("/* v8 ignore next 2 */\nb();\nc();\nd();\n");
    const auto& lines = text.lines();
    CHECK(lines[0].ignore);
    CHECK(lines[1].ignore);
    CHECK(lines[2].ignore);
    CHECK_FALSE(lines[3].ignore);
  }

  SUBCASE("counts too large for a line number ignore the rest of the file") {
    for (const char* count : {"99999999999999999999999", "4294967297"}) {
      convert::source_text text(std::string("/* c8 ignore next ") + count + " */\nx();\ny();\n");
      const auto& lines = text.lines();
      REQUIRE(lines.size() == 3);
      CHECK(lines[0].ignore);
      CHECK(lines[1].ignore);
      CHECK(lines[2].ignore);
    }
  }

  SUBCASE("trailing ignore next only covers its own line") {
    convert::source_text text("a(); /* c8 ignore next */\nb();\n");
    CHECK(text.lines()[0].ignore);
    CHECK_FALSE(text.lines()[1].ignore);
  }

  SUBCASE("start and stop bracket a region") {
    convert::source_text text("a();\n/* c8 ignore start */\nb();\nc();\n/* c8 ignore stop */\nd();\n");
    const auto& lines = text.lines();
    REQUIRE(lines.size() == 6);
    CHECK_FALSE(lines[0].ignore);
    CHECK(lines[1].ignore);
    CHECK(lines[2].ignore);
    CHECK(lines[3].ignore);
    CHECK(lines[4].ignore);
    CHECK_FALSE(lines[5].ignore);
  }
}

TEST_CASE("placeholder sources and source mapping comments") {
  CHECK(convert::make_placeholder_source({3, 0, 2}) == "...\n\n..\n");
  CHECK(convert::make_placeholder_source({}).empty());

  auto url = convert::find_source_mapping_url("x();\n//# sourceMappingURL=x.js.map\n");
  REQUIRE(url.has_value());
  CHECK(*url == "x.js.map");

  auto last = convert::find_source_mapping_url("//@ sourceMappingURL=old.map\n//# sourceMappingURL=new.map");
  REQUIRE(last.has_value());
  CHECK(*last == "new.map");

  CHECK_FALSE(convert::find_source_mapping_url("x();\n").has_value());
}
