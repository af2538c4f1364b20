#ifndef SUBTREE_RENDER_INDICES_H
#define SUBTREE_RENDER_INDICES_H

#include <ostream>
#include <string_view>

#include "tree/node.h"

namespace subtree {

// Writes one line per node of the subtree rooted at `node`, prefixed with the
// node's path from `node` as right-justified child indices. These indices may
// be passed back as path components to select that node. When `show_root` is
// false the line for `node` itself is omitted.
void RenderIndices(std::string_view text, Node const &node, bool show_root,
                   std::ostream &os);

}  // namespace subtree

#endif  // SUBTREE_RENDER_INDICES_H
