#ifndef SUBTREE_TEXT_LINE_SCANNER_H
#define SUBTREE_TEXT_LINE_SCANNER_H

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

#include "text/matcher.h"
#include "text/span.h"

namespace subtree {

// One line of input. `line` covers the whole line including its terminator;
// `value` covers the portion of the line holding the node's label. Both are
// absolute offsets into the scanned buffer.
struct ScannedLine {
  Span line;
  Span value;

  // The value's starting column measured in code points from the start of the
  // line. This is the depth marker used to reconstruct the tree.
  size_t column = 0;

  bool operator==(ScannedLine const &) const = default;
};

struct ScanOptions {
  // Use the last match on each line rather than the first.
  bool use_last_match = false;
  // Start the value at the end of the match rather than at its beginning.
  bool start_after_match = false;
};

inline constexpr char kLineTerminator = '\n';

// Splits a buffer into lines and locates the value within each one. A
// `LineScanner` is a single-pass input range: lines are produced on demand and
// each line is produced exactly once.
struct LineScanner {
  explicit LineScanner(std::string_view text, Matcher const &matcher,
                       ScanOptions options = {})
      : text_(text), matcher_(matcher), options_(options) {}

  LineScanner(LineScanner const &) = delete;
  LineScanner &operator=(LineScanner const &) = delete;

  // Returns the next line, or `std::nullopt` once the buffer is exhausted.
  std::optional<ScannedLine> Next();

  struct iterator {
    using iterator_category = std::input_iterator_tag;
    using value_type        = ScannedLine;
    using difference_type   = std::ptrdiff_t;

    iterator() = default;

    ScannedLine const &operator*() const { return *current_; }
    ScannedLine const *operator->() const { return &*current_; }

    iterator &operator++() {
      current_ = scanner_->Next();
      return *this;
    }
    void operator++(int) { ++*this; }

    friend bool operator==(iterator const &i, std::default_sentinel_t) {
      return not i.current_.has_value();
    }

   private:
    friend LineScanner;
    explicit iterator(LineScanner *scanner)
        : scanner_(scanner), current_(scanner->Next()) {}

    LineScanner *scanner_ = nullptr;
    std::optional<ScannedLine> current_;
  };

  iterator begin() { return iterator(this); }
  std::default_sentinel_t end() const { return std::default_sentinel; }

 private:
  std::string_view text_;
  Matcher const &matcher_;
  ScanOptions options_;
  size_t cursor_ = 0;
};

}  // namespace subtree

#endif  // SUBTREE_TEXT_LINE_SCANNER_H
