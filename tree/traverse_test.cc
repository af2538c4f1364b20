#include "tree/traverse.h"

#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "tree/builder.h"

namespace subtree {
namespace {

using ::testing::ElementsAre;
using ::testing::Pair;
using ::testing::UnorderedElementsAreArray;

// a
//   b
//     c
//     d
//   e
// f
constexpr std::string_view kText = "a\n  b\n    c\n    d\n  e\nf\n";

std::vector<std::string_view> Labels(Traversal<accumulate::Value> &t) {
  std::vector<std::string_view> labels;
  for (NodeValue const *v : t) { labels.push_back(v->Text(kText)); }
  return labels;
}

TEST(Traverse, DepthFirstIsDocumentOrder) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  auto t    = Traverse(root, Order::DepthFirst, accumulate::Value{});
  EXPECT_THAT(Labels(t), ElementsAre("", "a", "b", "c", "d", "e", "f"));
}

TEST(Traverse, BreadthFirstIsLevelOrder) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  auto t    = Traverse(root, Order::BreadthFirst, accumulate::Value{});
  EXPECT_THAT(Labels(t), ElementsAre("", "a", "f", "b", "e", "c", "d"));
}

TEST(Traverse, OrdersVisitTheSameNodesOnce) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  std::vector<Node const *> depth_first, breadth_first;
  for (Node const *n :
       Traverse(root, Order::DepthFirst, accumulate::Identity{})) {
    depth_first.push_back(n);
  }
  for (Node const *n :
       Traverse(root, Order::BreadthFirst, accumulate::Identity{})) {
    breadth_first.push_back(n);
  }
  EXPECT_EQ(depth_first.size(), 7);
  EXPECT_THAT(breadth_first, UnorderedElementsAreArray(depth_first));
}

TEST(Traverse, SubtreeStartsAtGivenNode) {
  IndentationMatcher m;
  Node root     = BuildTree(kText, m);
  Node const &b = root.child(0).child(0);
  auto t        = Traverse(b, Order::DepthFirst, accumulate::Value{});
  EXPECT_THAT(Labels(t), ElementsAre("b", "c", "d"));
}

TEST(Traverse, IsSinglePass) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  auto t    = Traverse(root, Order::DepthFirst, accumulate::Depth{});
  size_t n  = 0;
  while (t.Next()) { ++n; }
  EXPECT_EQ(n, 7);
  EXPECT_EQ(t.Next(), std::nullopt);
  EXPECT_TRUE(t.begin() == t.end());
}

TEST(Accumulate, Depth) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  std::vector<size_t> depths;
  for (size_t d : Traverse(root, Order::DepthFirst, accumulate::Depth{})) {
    depths.push_back(d);
  }
  EXPECT_THAT(depths, ElementsAre(0, 1, 2, 3, 3, 2, 1));
}

TEST(Accumulate, Path) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  std::vector<std::vector<size_t>> paths;
  for (auto const &p : Traverse(root, Order::DepthFirst, accumulate::Path{})) {
    paths.push_back(p);
  }
  EXPECT_THAT(paths, ElementsAre(ElementsAre(), ElementsAre(0),
                                 ElementsAre(0, 0), ElementsAre(0, 0, 0),
                                 ElementsAre(0, 0, 1), ElementsAre(0, 1),
                                 ElementsAre(1)));
}

TEST(Accumulate, PathWithPrefix) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  std::vector<std::vector<size_t>> paths;
  for (auto const &p : Traverse(root.child(1), Order::DepthFirst,
                                accumulate::Path(std::vector<size_t>{1}))) {
    paths.push_back(p);
  }
  EXPECT_THAT(paths, ElementsAre(ElementsAre(1)));
}

TEST(Accumulate, IsLast) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  std::vector<bool> last;
  for (bool b : Traverse(root, Order::DepthFirst, accumulate::IsLast{})) {
    last.push_back(b);
  }
  EXPECT_THAT(last, ElementsAre(true, false, false, false, true, true, true));
}

TEST(Accumulate, ParentAndAll) {
  IndentationMatcher m;
  Node root     = BuildTree(kText, m);
  Node const &a = root.child(0);

  std::vector<Node const *> parents;
  for (Node const *p : Traverse(a, Order::DepthFirst, accumulate::Parent{})) {
    parents.push_back(p);
  }
  EXPECT_THAT(parents, ElementsAre(nullptr, &a, &a.child(0), &a.child(0), &a));

  std::vector<Visit> visits;
  for (Visit const &v : Traverse(a, Order::DepthFirst, accumulate::All{})) {
    visits.push_back(v);
  }
  ASSERT_EQ(visits.size(), 5);
  EXPECT_EQ(visits[0], (Visit{nullptr, 0, &a}));
  EXPECT_EQ(visits[4], (Visit{&a, 1, &a.child(1)}));
}

TEST(Accumulate, Combined) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  auto acc  = accumulate::Combine(accumulate::Depth{}, accumulate::IsLast{},
                                  accumulate::Value{});
  std::vector<std::tuple<size_t, bool, std::string_view>> rows;
  for (auto const &[depth, is_last, value] :
       Traverse(root.child(0), Order::DepthFirst, acc)) {
    rows.emplace_back(depth, is_last, value->Text(kText));
  }
  EXPECT_THAT(rows, ElementsAre(std::tuple(0, true, "a"),
                                std::tuple(1, false, "b"),
                                std::tuple(2, false, "c"),
                                std::tuple(2, true, "d"),
                                std::tuple(1, true, "e")));
}

TEST(Accumulate, CombinedUsesEachDefault) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  auto acc = accumulate::Combine(accumulate::Depth{}, accumulate::Path{});
  auto t   = Traverse(root, Order::DepthFirst, acc,
                      {5, std::vector<size_t>{7}});
  auto first = t.Next();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(std::get<0>(*first), 5);
  EXPECT_THAT(std::get<1>(*first), ElementsAre(7));
  auto second = t.Next();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(std::get<0>(*second), 6);
  EXPECT_THAT(std::get<1>(*second), ElementsAre(7, 0));
}

}  // namespace
}  // namespace subtree
