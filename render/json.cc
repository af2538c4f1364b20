#include "render/json.h"

#include <string>

namespace subtree {
namespace {

nlohmann::json ChildrenToJson(std::string_view text, Node const &node) {
  nlohmann::json children = nlohmann::json::array();
  for (auto const &child : node.children()) {
    children.push_back(ToJson(text, *child));
  }
  return children;
}

}  // namespace

nlohmann::json ToJson(std::string_view text, Node const &node) {
  std::string label(node.value().Text(text));
  if (node.is_leaf()) { return label; }
  nlohmann::json object = nlohmann::json::object();
  object[label]         = ChildrenToJson(text, node);
  return object;
}

void RenderJson(std::string_view text, Node const &node, bool show_root,
                std::ostream &os) {
  nlohmann::json json =
      show_root ? ToJson(text, node) : ChildrenToJson(text, node);
  // Input is arbitrary bytes; invalid UTF-8 is replaced rather than rejected.
  os << json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace subtree
