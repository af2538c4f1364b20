#include "tree/path.h"

#include <utility>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "base/log.h"

namespace subtree {
namespace {

bool LooksLikeIndex(std::string_view s) {
  if (not s.empty() and s.front() == '-') { s.remove_prefix(1); }
  if (s.empty()) { return false; }
  for (char c : s) {
    if (not absl::ascii_isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

absl::StatusOr<Node const *> SelectIndex(Node const &node, int64_t index) {
  auto n          = static_cast<int64_t>(node.num_children());
  int64_t element = index < 0 ? n + index : index;
  if (element < 0 or element >= n) {
    return absl::OutOfRangeError(absl::StrFormat(
        "Index %d is out of range for a node with %d children.", index, n));
  }
  return &node.child(static_cast<size_t>(element));
}

absl::StatusOr<Node const *> SelectText(std::string_view text,
                                        Node const &node,
                                        std::string_view label) {
  for (auto const &child : node.children()) {
    if (child->value().Text(text) == label) { return child.get(); }
  }
  return absl::NotFoundError(absl::StrFormat(
      R"(No child named "%s". Available: %s)", label,
      absl::StrJoin(node.children(), " ",
                    [&](std::string *out, auto const &child) {
                      absl::StrAppend(out, child->value().Text(text));
                    })));
}

}  // namespace

absl::StatusOr<PathComponent> PathComponent::Parse(std::string_view component) {
  if (not component.empty() and component.front() == '\\') {
    return PathComponent::Text(std::string(component.substr(1)));
  }
  if (LooksLikeIndex(component)) {
    int64_t n;
    if (not absl::SimpleAtoi(component, &n)) {
      return absl::InvalidArgumentError(
          absl::StrFormat(R"(Path component "%s" is not a valid index.)",
                          component));
    }
    return PathComponent::Index(n);
  }
  return PathComponent::Text(std::string(component));
}

std::string PathComponent::DebugString() const {
  if (is_index()) { return absl::StrCat(index()); }
  return absl::StrCat("\"", text(), "\"");
}

absl::StatusOr<std::vector<PathComponent>> ParsePath(
    absl::Span<std::string const> components) {
  std::vector<PathComponent> path;
  path.reserve(components.size());
  for (std::string const &c : components) {
    absl::StatusOr<PathComponent> component = PathComponent::Parse(c);
    if (not component.ok()) { return std::move(component).status(); }
    path.push_back(*std::move(component));
  }
  return path;
}

absl::StatusOr<Node const *> ResolvePath(std::string_view text,
                                         Node const &start,
                                         absl::Span<PathComponent const> path) {
  Node const *node = &start;
  for (PathComponent const &component : path) {
    LOG("path", "selecting %s", component.DebugString());
    absl::StatusOr<Node const *> next =
        component.is_index() ? SelectIndex(*node, component.index())
                             : SelectText(text, *node, component.text());
    if (not next.ok()) { return next; }
    node = *next;
  }
  return node;
}

}  // namespace subtree
