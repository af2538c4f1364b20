#include "render/indices.h"

#include <vector>

#include "absl/strings/str_format.h"
#include "tree/traverse.h"

namespace subtree {
namespace {

constexpr int kIndexWidth = 3;

void RenderFrom(std::string_view text, Node const &node,
                std::vector<size_t> path, std::ostream &os) {
  auto accumulator =
      accumulate::Combine(accumulate::Path{}, accumulate::Value{});
  for (auto const &[p, value] : Traverse(node, Order::DepthFirst, accumulator,
                                         {std::move(path), nullptr})) {
    for (size_t index : p) {
      os << absl::StreamFormat("%*d", kIndexWidth, index);
    }
    os << (p.empty() ? "  " : "   ") << value->Text(text) << '\n';
  }
}

}  // namespace

void RenderIndices(std::string_view text, Node const &node, bool show_root,
                   std::ostream &os) {
  if (show_root) {
    RenderFrom(text, node, {}, os);
    return;
  }
  for (size_t i = 0; i < node.num_children(); ++i) {
    RenderFrom(text, node.child(i), {i}, os);
  }
}

}  // namespace subtree
