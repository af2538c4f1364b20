#include "toolchain/subtree.h"

#include "base/log.h"
#include "render/as_is.h"
#include "render/indices.h"
#include "render/json.h"
#include "render/themed.h"
#include "tree/builder.h"
#include "tree/path.h"

namespace subtree {

absl::Status Run(Options const &options, std::string_view input,
                 std::ostream &os) {
  Node root = BuildTree(input, *options.matcher, options.scan);

  absl::StatusOr<Node const *> selected =
      ResolvePath(input, root, options.path);
  if (not selected.ok()) { return selected.status(); }
  Node const &node = **selected;
  bool show_root   = options.show_root();

  switch (options.format) {
    case OutputFormat::Plain:
      if (options.theme) {
        LOG("render", "themed, root %s", show_root ? "shown" : "hidden");
        RenderThemed(input, node, show_root, *options.theme, os);
      } else {
        LOG("render", "as-is, root %s", show_root ? "shown" : "hidden");
        RenderAsIs(input, node, show_root, os);
      }
      break;
    case OutputFormat::Indices:
      LOG("render", "indices, root %s", show_root ? "shown" : "hidden");
      RenderIndices(input, node, show_root, os);
      break;
    case OutputFormat::Json:
      LOG("render", "json, root %s", show_root ? "shown" : "hidden");
      RenderJson(input, node, show_root, os);
      if (options.interactive) { os << '\n'; }
      break;
  }
  return absl::OkStatus();
}

}  // namespace subtree
