#ifndef SUBTREE_RENDER_AS_IS_H
#define SUBTREE_RENDER_AS_IS_H

#include <ostream>
#include <string_view>

#include "tree/node.h"

namespace subtree {

// Writes the subtree rooted at `node` exactly as it appears in `text`, except
// that indentation belonging to levels above `node` is removed so that the
// subtree stands on its own. When `show_root` is false, each of `node`'s
// children is written in this way instead of `node` itself.
void RenderAsIs(std::string_view text, Node const &node, bool show_root,
                std::ostream &os);

}  // namespace subtree

#endif  // SUBTREE_RENDER_AS_IS_H
