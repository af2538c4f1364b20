#include "render/themed.h"

#include <cstdint>
#include <vector>

#include "tree/traverse.h"

namespace subtree {

void RenderThemed(std::string_view text, Node const &node, bool show_root,
                  Theme const &theme, std::ostream &os) {
  // One slot per level from `node` down to the node being drawn. See `Theme`
  // for the meaning of each slot's bits.
  std::vector<uint8_t> slots;

  auto accumulator = accumulate::Combine(
      accumulate::Depth{}, accumulate::IsLast{}, accumulate::Value{});
  for (auto const &[depth, is_last, value] :
       Traverse(node, Order::DepthFirst, accumulator)) {
    slots.resize(depth);
    if (not slots.empty()) { slots.back() |= Theme::kVertical; }
    slots.push_back(is_last ? Theme::kLastBranch : Theme::kBranch);

    if (depth == 0 and not show_root) { continue; }
    // The first slot belongs to `node`, which never has a connector.
    for (size_t i = 1; i < slots.size(); ++i) { os << theme.glyph(slots[i]); }
    os << value->Text(text) << '\n';
  }
}

}  // namespace subtree
