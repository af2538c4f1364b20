#include "render/as_is.h"

#include "tree/traverse.h"

namespace subtree {

void RenderAsIs(std::string_view text, Node const &node, bool show_root,
                std::ostream &os) {
  if (not show_root) {
    for (auto const &child : node.children()) {
      RenderAsIs(text, *child, true, os);
    }
    return;
  }

  size_t levels_above = node.value().depth();
  for (NodeValue const *value :
       Traverse(node, Order::DepthFirst, accumulate::Value{})) {
    for (size_t i = levels_above; i < value->prefixes.size(); ++i) {
      os << value->prefixes[i].In(text);
    }
    os << value->text.In(text) << value->suffix.In(text);
  }
}

}  // namespace subtree
