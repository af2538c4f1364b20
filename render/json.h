#ifndef SUBTREE_RENDER_JSON_H
#define SUBTREE_RENDER_JSON_H

#include <ostream>
#include <string_view>

#include "nlohmann/json.hpp"
#include "tree/node.h"

namespace subtree {

// Returns the JSON encoding of the subtree rooted at `node`. A leaf is encoded
// as its value string; any other node as an object with a single member whose
// key is the node's value and whose value is the array of its children's
// encodings.
nlohmann::json ToJson(std::string_view text, Node const &node);

// Writes the encoding of `node` on a single line with no trailing newline.
// When `show_root` is false, writes the array of `node`'s children's
// encodings instead.
void RenderJson(std::string_view text, Node const &node, bool show_root,
                std::ostream &os);

}  // namespace subtree

#endif  // SUBTREE_RENDER_JSON_H
