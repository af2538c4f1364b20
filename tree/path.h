#ifndef SUBTREE_TREE_PATH_H
#define SUBTREE_TREE_PATH_H

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "tree/node.h"

namespace subtree {

// One step of a path from a node to one of its descendants: either the index
// of a child or the text of a child's value.
struct PathComponent {
  // Parses a command-line path component. A component consisting of an
  // optional minus sign followed by digits is an index; a component beginning
  // with a backslash is the text following the backslash; anything else is
  // text. Returns an `InvalidArgument` error for an index that does not fit in
  // 64 bits.
  static absl::StatusOr<PathComponent> Parse(std::string_view component);

  static PathComponent Index(int64_t n) { return PathComponent(n); }
  static PathComponent Text(std::string s) {
    return PathComponent(std::move(s));
  }

  bool is_index() const { return std::holds_alternative<int64_t>(value_); }
  int64_t index() const { return std::get<int64_t>(value_); }
  std::string_view text() const { return std::get<std::string>(value_); }

  std::string DebugString() const;

  bool operator==(PathComponent const &) const = default;

 private:
  explicit PathComponent(int64_t n) : value_(n) {}
  explicit PathComponent(std::string s) : value_(std::move(s)) {}

  std::variant<int64_t, std::string> value_;
};

absl::StatusOr<std::vector<PathComponent>> ParsePath(
    absl::Span<std::string const> components);

// Walks from `start` along `path`. An index selects the child at that position,
// counting from the end when negative, and fails with `OutOfRange` if there is
// no such child. Text selects the first child whose value equals it and fails
// with `NotFound`, listing every child's value, if there is none. `text` is the
// buffer the tree was built from.
absl::StatusOr<Node const *> ResolvePath(std::string_view text,
                                         Node const &start,
                                         absl::Span<PathComponent const> path);

}  // namespace subtree

#endif  // SUBTREE_TREE_PATH_H
