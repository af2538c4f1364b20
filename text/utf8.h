#ifndef SUBTREE_TEXT_UTF8_H
#define SUBTREE_TEXT_UTF8_H

#include <cstddef>
#include <string_view>

namespace subtree::utf8 {

// A single decoded code point along with the number of bytes it occupies.
// Malformed sequences decode to the value of their first byte with a length
// of one, so that scanning always makes progress.
struct Decoded {
  char32_t code_point;
  size_t length;
};

constexpr bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xc0) == 0x80;
}

// Decodes the code point beginning at byte `offset` of `text`. Requires
// `offset < text.size()`.
Decoded DecodeAt(std::string_view text, size_t offset);

// Returns the number of code points in `text`.
size_t CodePointCount(std::string_view text);

// Returns the byte offset reached after stepping over `n` code points from the
// beginning of `text`, or `text.size()` if `text` has fewer than `n` code
// points.
size_t ByteOffsetOf(std::string_view text, size_t n);

// Box-drawing characters occupy the block U+2500 through U+257F.
constexpr bool IsBoxDrawing(char32_t c) { return 0x2500 <= c and c <= 0x257f; }

}  // namespace subtree::utf8

#endif  // SUBTREE_TEXT_UTF8_H
