#include "tree/builder.h"

#include <cstdint>
#include <vector>

#include "base/log.h"
#include "text/utf8.h"

namespace subtree {
namespace {

// A node whose subtree may still receive lines, along with its depth marker.
struct OpenNode {
  int64_t column;
  Node *node;
};

// Splits the indentation of `line` at each open ancestor's column.
std::vector<Span> Prefixes(std::string_view text, ScannedLine const &line,
                           std::span<OpenNode const> ancestors) {
  std::string_view line_text = line.line.In(text);
  std::vector<Span> prefixes;
  prefixes.reserve(ancestors.size() + 1);
  size_t previous = 0;
  for (OpenNode const &ancestor : ancestors) {
    size_t offset = utf8::ByteOffsetOf(line_text, ancestor.column);
    prefixes.push_back(Span(previous, offset).Shifted(line.line.start()));
    previous = offset;
  }
  prefixes.push_back(Span(line.line.start() + previous, line.value.start()));
  return prefixes;
}

}  // namespace

Node BuildTree(std::string_view text, LineScanner &lines) {
  Node root;
  std::vector<OpenNode> stack = {{.column = -1, .node = &root}};

  for (ScannedLine const &line : lines) {
    auto column = static_cast<int64_t>(line.column);
    while (column <= stack.back().column) {
      LOG("build", "closing column %d at column %d", stack.back().column,
          column);
      stack.pop_back();
    }

    NodeValue value{
        .prefixes = Prefixes(text, line,
                             std::span<OpenNode const>(stack).subspan(1)),
        .text     = line.value,
        .suffix   = Span(line.value.stop(), line.line.stop()),
    };
    LOG("build", "\"%s\" at column %d, depth %u", value.Text(text), column,
        value.depth());
    Node &node = stack.back().node->AppendChild(std::move(value));
    stack.push_back({.column = column, .node = &node});
  }
  return root;
}

Node BuildTree(std::string_view text, Matcher const &matcher,
               ScanOptions options) {
  LineScanner lines(text, matcher, options);
  return BuildTree(text, lines);
}

}  // namespace subtree
