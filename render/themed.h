#ifndef SUBTREE_RENDER_THEMED_H
#define SUBTREE_RENDER_THEMED_H

#include <ostream>
#include <string_view>

#include "render/theme.h"
#include "tree/node.h"

namespace subtree {

// Writes one line per node of the subtree rooted at `node`: the connector
// glyphs from `theme` for each level below `node`, followed by the node's
// value. When `show_root` is false the line for `node` itself is omitted.
void RenderThemed(std::string_view text, Node const &node, bool show_root,
                  Theme const &theme, std::ostream &os);

}  // namespace subtree

#endif  // SUBTREE_RENDER_THEMED_H
