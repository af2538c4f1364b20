#ifndef SUBTREE_TREE_TRAVERSE_H
#define SUBTREE_TREE_TRAVERSE_H

#include <concepts>
#include <cstddef>
#include <deque>
#include <iterator>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

#include "tree/node.h"

namespace subtree {

// The raw arguments describing a single step of a traversal. For the node at
// which the traversal starts `parent` is null and `index` is zero.
struct Visit {
  Node const *parent;
  size_t index;
  Node const *node;

  bool operator==(Visit const &) const = default;
};

enum class Order { DepthFirst, BreadthFirst };

// An accumulator computes one value per visited node from the visit and the
// value it computed for the node's parent. For the starting node, whose parent
// value is not computed by the traversal, the accumulator's `Default()` is
// used in its place.
template <typename A>
concept Accumulator = requires(A const &a, Visit const &v,
                               typename A::value_type const &parent_value) {
  typename A::value_type;
  { a.Default() } -> std::convertible_to<typename A::value_type>;
  { a(v, parent_value) } -> std::convertible_to<typename A::value_type>;
};

namespace accumulate {

// The visited node itself.
struct Identity {
  using value_type = Node const *;
  value_type Default() const { return nullptr; }
  value_type operator()(Visit const &v, value_type) const { return v.node; }
};

// The visited node's parent, or null for the starting node.
struct Parent {
  using value_type = Node const *;
  value_type Default() const { return nullptr; }
  value_type operator()(Visit const &v, value_type) const { return v.parent; }
};

// Whether the visited node is the last child of its parent. The starting node
// is considered last.
struct IsLast {
  using value_type = bool;
  value_type Default() const { return true; }
  value_type operator()(Visit const &v, value_type) const {
    return v.parent == nullptr or v.index + 1 == v.parent->num_children();
  }
};

// The visited node's value.
struct Value {
  using value_type = NodeValue const *;
  value_type Default() const { return nullptr; }
  value_type operator()(Visit const &v, value_type) const {
    return &v.node->value();
  }
};

// The sequence of child indices leading from the starting node to the visited
// node. The starting node's path is the default, which is empty unless a
// prefix is supplied.
struct Path {
  using value_type = std::vector<size_t>;

  Path() = default;
  explicit Path(std::vector<size_t> prefix) : prefix_(std::move(prefix)) {}

  value_type Default() const { return prefix_; }
  value_type operator()(Visit const &v, value_type const &parent_path) const {
    if (v.parent == nullptr) { return parent_path; }
    value_type path = parent_path;
    path.push_back(v.index);
    return path;
  }

 private:
  std::vector<size_t> prefix_;
};

// The number of edges between the starting node and the visited node.
struct Depth {
  using value_type = size_t;
  value_type Default() const { return 0; }
  value_type operator()(Visit const &v, value_type parent_depth) const {
    return v.parent == nullptr ? parent_depth : parent_depth + 1;
  }
};

// The raw visit.
struct All {
  using value_type = Visit;
  value_type Default() const { return {nullptr, 0, nullptr}; }
  value_type operator()(Visit const &v, value_type const &) const { return v; }
};

// Runs several accumulators side by side, producing a tuple holding each of
// their values. Each accumulator sees only its own component of the parent's
// tuple, and the default is the tuple of each accumulator's default.
template <Accumulator... As>
struct Combined {
  using value_type = std::tuple<typename As::value_type...>;

  explicit Combined(As... accumulators)
      : accumulators_(std::move(accumulators)...) {}

  value_type Default() const {
    return std::apply(
        [](auto const &...a) { return value_type(a.Default()...); },
        accumulators_);
  }

  value_type operator()(Visit const &v, value_type const &parent_value) const {
    return Apply(v, parent_value, std::index_sequence_for<As...>{});
  }

 private:
  template <size_t... Ns>
  value_type Apply(Visit const &v, value_type const &parent_value,
                   std::index_sequence<Ns...>) const {
    return value_type(
        std::get<Ns>(accumulators_)(v, std::get<Ns>(parent_value))...);
  }

  std::tuple<As...> accumulators_;
};

template <Accumulator... As>
Combined<As...> Combine(As... accumulators) {
  return Combined<As...>(std::move(accumulators)...);
}

}  // namespace accumulate

// A lazily evaluated, single-pass traversal of the subtree rooted at a node,
// yielding the accumulated value for each node as it is visited. Depth-first
// order visits a parent before its children and children in document order;
// breadth-first order visits nodes level by level.
template <Accumulator A>
struct Traversal {
  using value_type = typename A::value_type;

  explicit Traversal(Node const &start, Order order, A accumulator)
      : Traversal(start, order, accumulator, accumulator.Default()) {}

  explicit Traversal(Node const &start, Order order, A accumulator,
                     value_type start_default)
      : order_(order), accumulator_(std::move(accumulator)) {
    pending_.push_back(Pending{.visit        = {nullptr, 0, &start},
                               .parent_value = std::move(start_default)});
  }

  Traversal(Traversal const &) = delete;
  Traversal &operator=(Traversal const &) = delete;

  // Visits the next node and returns its accumulated value, or `std::nullopt`
  // once every node has been visited.
  std::optional<value_type> Next() {
    if (pending_.empty()) { return std::nullopt; }

    Pending p;
    if (order_ == Order::DepthFirst) {
      p = std::move(pending_.back());
      pending_.pop_back();
    } else {
      p = std::move(pending_.front());
      pending_.pop_front();
    }

    value_type value = accumulator_(p.visit, p.parent_value);
    auto children    = p.visit.node->children();
    if (order_ == Order::DepthFirst) {
      for (size_t i = children.size(); i > 0; --i) {
        pending_.push_back(Pending{.visit = {p.visit.node, i - 1,
                                             children[i - 1].get()},
                                   .parent_value = value});
      }
    } else {
      for (size_t i = 0; i < children.size(); ++i) {
        pending_.push_back(
            Pending{.visit        = {p.visit.node, i, children[i].get()},
                    .parent_value = value});
      }
    }
    return value;
  }

  struct iterator {
    using iterator_category = std::input_iterator_tag;
    using value_type        = typename Traversal::value_type;
    using difference_type   = std::ptrdiff_t;

    iterator() = default;

    value_type const &operator*() const { return *current_; }
    value_type const *operator->() const { return &*current_; }

    iterator &operator++() {
      current_ = traversal_->Next();
      return *this;
    }
    void operator++(int) { ++*this; }

    friend bool operator==(iterator const &i, std::default_sentinel_t) {
      return not i.current_.has_value();
    }

   private:
    friend Traversal;
    explicit iterator(Traversal *t) : traversal_(t), current_(t->Next()) {}

    Traversal *traversal_ = nullptr;
    std::optional<value_type> current_;
  };

  iterator begin() { return iterator(this); }
  std::default_sentinel_t end() const { return std::default_sentinel; }

 private:
  struct Pending {
    Visit visit;
    value_type parent_value;
  };

  Order order_;
  A accumulator_;
  std::deque<Pending> pending_;
};

template <Accumulator A>
Traversal<A> Traverse(Node const &start, Order order, A accumulator) {
  return Traversal<A>(start, order, std::move(accumulator));
}

template <Accumulator A>
Traversal<A> Traverse(Node const &start, Order order, A accumulator,
                      typename A::value_type start_default) {
  return Traversal<A>(start, order, std::move(accumulator),
                      std::move(start_default));
}

}  // namespace subtree

#endif  // SUBTREE_TREE_TRAVERSE_H
