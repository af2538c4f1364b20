#ifndef SUBTREE_TEXT_SPAN_H
#define SUBTREE_TEXT_SPAN_H

#include <algorithm>
#include <cstddef>
#include <limits>
#include <ostream>
#include <string_view>

namespace subtree {

// Represents a half-open range `[start, stop)` of byte offsets into a text
// buffer that is held elsewhere. The stop offset may be unbounded, in which
// case the span extends to the end of whatever buffer it is applied to. Spans
// are values: every operation returns a new span rather than modifying this
// one.
struct Span {
  static constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();

  constexpr Span() = default;
  explicit constexpr Span(size_t start, size_t stop = kUnbounded)
      : start_(start), stop_(std::max(start, stop)) {}

  // Returns a span beginning at `start` and extending to the end of the buffer.
  static constexpr Span ToEnd(size_t start) { return Span(start); }

  // Returns the empty span located at `offset`.
  static constexpr Span Empty(size_t offset) { return Span(offset, offset); }

  constexpr size_t start() const { return start_; }
  constexpr size_t stop() const { return stop_; }
  constexpr bool bounded() const { return stop_ != kUnbounded; }

  // Number of bytes covered. Only meaningful for bounded spans.
  constexpr size_t size() const { return stop_ - start_; }
  constexpr bool empty() const { return start_ == stop_; }

  // Returns a bounded span with both endpoints limited to `length`.
  constexpr Span Clamped(size_t length) const {
    return Span(std::min(start_, length), std::min(stop_, length));
  }

  // Returns the sub-range `[start() + begin, start() + end)`, where `begin` and
  // `end` are relative to the start of this span. The result never extends
  // past `stop()`.
  constexpr Span Subspan(size_t begin, size_t end = kUnbounded) const {
    size_t new_start = Advance(start_, begin);
    size_t new_stop  = Advance(start_, end);
    return Span(std::min(new_start, stop_), std::min(new_stop, stop_));
  }

  // Returns this span translated by `offset` bytes. An unbounded stop remains
  // unbounded.
  constexpr Span Shifted(size_t offset) const {
    return Span(start_ + offset, bounded() ? stop_ + offset : kUnbounded);
  }

  // Returns the text covered by this span within `text`, clamping to the
  // bounds of `text`.
  constexpr std::string_view In(std::string_view text) const {
    Span s = Clamped(text.size());
    return text.substr(s.start_, s.size());
  }

  constexpr bool operator==(Span const &) const = default;

  friend std::ostream &operator<<(std::ostream &os, Span const &s) {
    os << "Span[" << s.start_ << ", ";
    if (s.bounded()) {
      os << s.stop_;
    } else {
      os << "end";
    }
    return os << ")";
  }

 private:
  static constexpr size_t Advance(size_t base, size_t by) {
    return by > kUnbounded - base ? kUnbounded : base + by;
  }

  size_t start_ = 0;
  size_t stop_  = 0;
};

}  // namespace subtree

#endif  // SUBTREE_TEXT_SPAN_H
