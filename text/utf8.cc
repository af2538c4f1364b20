#include "text/utf8.h"

namespace subtree::utf8 {
namespace {

// Returns the length of the sequence introduced by `lead`, or zero if `lead`
// cannot begin a sequence.
size_t SequenceLength(unsigned char lead) {
  if (lead < 0x80) { return 1; }
  if ((lead & 0xe0) == 0xc0) { return 2; }
  if ((lead & 0xf0) == 0xe0) { return 3; }
  if ((lead & 0xf8) == 0xf0) { return 4; }
  return 0;
}

}  // namespace

Decoded DecodeAt(std::string_view text, size_t offset) {
  auto lead     = static_cast<unsigned char>(text[offset]);
  size_t length = SequenceLength(lead);
  if (length == 1) { return {.code_point = lead, .length = 1}; }
  if (length == 0 or offset + length > text.size()) {
    return {.code_point = lead, .length = 1};
  }

  char32_t code_point = lead & (0x7f >> length);
  for (size_t i = 1; i < length; ++i) {
    char c = text[offset + i];
    if (not IsContinuationByte(c)) { return {.code_point = lead, .length = 1}; }
    code_point = (code_point << 6) | (static_cast<unsigned char>(c) & 0x3f);
  }
  return {.code_point = code_point, .length = length};
}

size_t CodePointCount(std::string_view text) {
  size_t count = 0;
  for (size_t offset = 0; offset < text.size();
       offset += DecodeAt(text, offset).length) {
    ++count;
  }
  return count;
}

size_t ByteOffsetOf(std::string_view text, size_t n) {
  size_t offset = 0;
  for (; n > 0 and offset < text.size(); --n) {
    offset += DecodeAt(text, offset).length;
  }
  return offset;
}

}  // namespace subtree::utf8
