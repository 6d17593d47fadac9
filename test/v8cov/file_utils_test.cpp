#include <doctest/doctest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "test_helpers.hpp"
#include "v8cov/util/file_utils.hpp"

using namespace v8cov;

namespace {

// iterator over fixed names that can fail one increment the way directory iterators do:
// the error is reported and the iterator becomes the end iterator
class scripted_iterator {
public:
  scripted_iterator() = default;
  scripted_iterator(std::vector<std::string> names, size_t fail_after)
      : names_(std::move(names)), fail_after_(fail_after) {}

  const std::string& operator*() const { return names_[index_]; }

  bool operator!=(const scripted_iterator& other) const { return at_end() != other.at_end(); }

  scripted_iterator& increment(std::error_code& ec) {
    ec.clear();
    if (index_ + 1 == fail_after_) {
      ec = std::make_error_code(std::errc::io_error);
      names_.clear();
      index_ = 0;
      return *this;
    }
    ++index_;
    return *this;
  }

private:
  bool at_end() const { return index_ >= names_.size(); }

  std::vector<std::string> names_;
  size_t index_ = 0;
  size_t fail_after_ = 0;
};

} // namespace

TEST_CASE("walk_directory visits every entry") {
  std::vector<std::string> seen;
  auto walked = util::walk_directory(scripted_iterator({"a", "b", "c"}, 0), [&](const scripted_iterator& it) {
    seen.push_back(*it);
  });
  CHECK(walked.ok());
  CHECK(seen == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("walk_directory reports a failed increment") {
  std::vector<std::string> seen;
  auto walked = util::walk_directory(scripted_iterator({"a", "b", "c"}, 2), [&](const scripted_iterator& it) {
    seen.push_back(*it);
  });
  CHECK_FALSE(walked.ok());
  CHECK(walked.code == error_code::io_error);
  CHECK(seen == std::vector<std::string>{"a", "b"});
}

TEST_CASE("walk_directory lists a real directory") {
  test_helpers::temp_dir dir("walk");
  dir.write("one.json", "{}");
  dir.write("two.json", "{}");

  std::vector<std::string> names;
  auto walked = util::walk_directory(
      std::filesystem::directory_iterator(dir.path()),
      [&](const std::filesystem::directory_iterator& it) { names.push_back(it->path().filename().string()); }
  );
  CHECK(walked.ok());
  std::sort(names.begin(), names.end());
  CHECK(names == std::vector<std::string>{"one.json", "two.json"});
}

TEST_CASE("read_text_file distinguishes missing files") {
  test_helpers::temp_dir dir("read");
  std::string file = dir.write("x.txt", "hello\n");

  auto contents = util::read_text_file(file);
  REQUIRE(contents.ok());
  CHECK(contents.value == "hello\n");

  CHECK(util::read_text_file(dir.file("missing.txt")).status.code == error_code::not_found);
}
