#ifndef SUBTREE_TREE_NODE_H
#define SUBTREE_TREE_NODE_H

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "text/span.h"

namespace subtree {

// The payload of a node. All spans refer to the buffer the tree was built
// from; a node never owns any text.
struct NodeValue {
  // One span per level from the top of the tree down to and including this
  // node. Each span covers the indentation on this node's line between the
  // value column of the ancestor at that level and the next one. The
  // concatenation of all prefixes is this node's full indentation.
  std::vector<Span> prefixes;
  // The node's label.
  Span text;
  // Everything on the line after the label, including the line terminator.
  Span suffix;

  // The number of levels between this node and the top of the tree it was
  // built in. The root of a tree has depth zero.
  size_t depth() const { return prefixes.size(); }

  std::string_view Text(std::string_view buffer) const {
    return text.In(buffer);
  }
};

// An ordered tree. Each node exclusively owns its children, which are kept in
// document order. Nodes hold no reference to their parent; traversals supply
// the parent as they go.
struct Node {
  Node() = default;
  explicit Node(NodeValue value) : value_(std::move(value)) {}

  Node(Node &&)            = default;
  Node &operator=(Node &&) = default;

  NodeValue const &value() const { return value_; }

  std::span<std::unique_ptr<Node> const> children() const { return children_; }
  size_t num_children() const { return children_.size(); }
  bool is_leaf() const { return children_.empty(); }

  Node const &child(size_t n) const { return *children_[n]; }

  // Appends a new last child holding `value` and returns it.
  Node &AppendChild(NodeValue value) {
    return *children_.emplace_back(std::make_unique<Node>(std::move(value)));
  }

 private:
  NodeValue value_;
  std::vector<std::unique_ptr<Node>> children_;
};

}  // namespace subtree

#endif  // SUBTREE_TREE_NODE_H
