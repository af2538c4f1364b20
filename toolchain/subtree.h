#ifndef SUBTREE_TOOLCHAIN_SUBTREE_H
#define SUBTREE_TOOLCHAIN_SUBTREE_H

#include <ostream>
#include <string_view>

#include "absl/status/status.h"
#include "toolchain/flags.h"

namespace subtree {

// Builds the tree encoded in `input`, selects the subtree named by
// `options.path` and writes it to `os` in the requested format. Fails only if
// the path cannot be resolved.
absl::Status Run(Options const &options, std::string_view input,
                 std::ostream &os);

}  // namespace subtree

#endif  // SUBTREE_TOOLCHAIN_SUBTREE_H
