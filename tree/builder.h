#ifndef SUBTREE_TREE_BUILDER_H
#define SUBTREE_TREE_BUILDER_H

#include <string_view>

#include "text/line_scanner.h"
#include "text/matcher.h"
#include "tree/node.h"

namespace subtree {

// Consumes every line produced by `lines` and returns the synthetic root of
// the reconstructed tree. `text` must be the buffer `lines` scans. A line
// becomes a child of the nearest preceding line whose value column is strictly
// smaller than its own; every other open line at an equal or greater column is
// closed first.
Node BuildTree(std::string_view text, LineScanner &lines);

Node BuildTree(std::string_view text, Matcher const &matcher,
               ScanOptions options = {});

}  // namespace subtree

#endif  // SUBTREE_TREE_BUILDER_H
