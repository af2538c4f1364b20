#include "render/indices.h"

#include <sstream>
#include <string>
#include <string_view>

#include "gtest/gtest.h"
#include "tree/builder.h"

namespace subtree {
namespace {

constexpr std::string_view kText = "a\n  b\n    c\n    d\n  e\nf\n";

std::string Render(Node const &node, bool show_root) {
  std::stringstream ss;
  RenderIndices(kText, node, show_root, ss);
  return ss.str();
}

TEST(RenderIndices, HiddenRoot) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  EXPECT_EQ(Render(root, false),
            "  0   a\n"
            "  0  0   b\n"
            "  0  0  0   c\n"
            "  0  0  1   d\n"
            "  0  1   e\n"
            "  1   f\n");
}

TEST(RenderIndices, ShownRoot) {
  IndentationMatcher m;
  Node root = BuildTree(kText, m);
  EXPECT_EQ(Render(root.child(0).child(0), true),
            "  b\n"
            "  0   c\n"
            "  1   d\n");
}

TEST(RenderIndices, WideIndices) {
  std::string text = "r\n";
  for (int i = 0; i < 12; ++i) { text += "  x\n"; }
  IndentationMatcher m;
  Node root = BuildTree(text, m);
  std::stringstream ss;
  RenderIndices(text, root.child(0), false, ss);
  std::string out = ss.str();
  EXPECT_NE(out.find(" 11   x\n"), std::string::npos);
  EXPECT_EQ(out.substr(0, 8), "  0   x\n");
}

TEST(RenderIndices, EmptyTree) {
  IndentationMatcher m;
  Node root = BuildTree("", m);
  std::stringstream ss;
  RenderIndices("", root, false, ss);
  EXPECT_EQ(ss.str(), "");
}

}  // namespace
}  // namespace subtree
