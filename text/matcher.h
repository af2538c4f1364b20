#ifndef SUBTREE_TEXT_MATCHER_H
#define SUBTREE_TEXT_MATCHER_H

#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"

namespace subtree {

// A match within a single line, as byte offsets relative to the start of that
// line.
struct Match {
  size_t begin;
  size_t end;

  bool operator==(Match const &) const = default;
};

// Locates the boundary between a line's indentation and its value. Lines
// passed to a `Matcher` never include their line terminator.
struct Matcher {
  virtual ~Matcher() = default;

  virtual std::optional<Match> First(std::string_view line) const = 0;
  virtual std::optional<Match> Last(std::string_view line) const  = 0;
};

// Matches either the first character that is neither whitespace nor a
// box-drawing character, or the end of the line. This recognizes both plain
// indentation and trees that have already been drawn with box characters.
struct IndentationMatcher : Matcher {
  std::optional<Match> First(std::string_view line) const override;
  std::optional<Match> Last(std::string_view line) const override;
};

// Matches a caller-supplied ECMAScript regular expression.
struct RegexMatcher : Matcher {
  static absl::StatusOr<std::unique_ptr<RegexMatcher>> Make(
      std::string_view pattern);

  std::optional<Match> First(std::string_view line) const override;
  std::optional<Match> Last(std::string_view line) const override;

 private:
  explicit RegexMatcher(std::regex regex) : regex_(std::move(regex)) {}

  std::regex regex_;
};

// Returns the built-in `IndentationMatcher` if `pattern` is empty and a
// `RegexMatcher` for `pattern` otherwise.
absl::StatusOr<std::unique_ptr<Matcher>> MakeMatcher(std::string_view pattern);

}  // namespace subtree

#endif  // SUBTREE_TEXT_MATCHER_H
