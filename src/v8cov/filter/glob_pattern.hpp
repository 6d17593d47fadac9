#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace v8cov::filter {

/**
 * a compiled path glob.
 *
 * supports "*", "?", "[...]" character classes (with "!" or "^" negation and ranges),
 * "{a,b}" alternation (nested) and "**" path segments matching zero or more directories.
 * leading dots are matched like any other character.
 */
class glob_pattern {
public:
  explicit glob_pattern(std::string_view pattern);

  bool matches(std::string_view path) const;

  const std::string& source() const { return source_; }

private:
  std::string source_;
  // one entry per brace alternative, each split on '/'
  std::vector<std::vector<std::string>> alternatives_;
};

// expands "{a,b}" groups into every alternative, left to right
std::vector<std::string> expand_braces(std::string_view pattern);

// matches a single path segment against a segment pattern without separators
bool match_segment(std::string_view pattern, std::string_view segment);

} // namespace v8cov::filter
