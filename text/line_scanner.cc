#include "text/line_scanner.h"

#include "base/log.h"
#include "text/utf8.h"

namespace subtree {

std::optional<ScannedLine> LineScanner::Next() {
  if (cursor_ >= text_.size()) { return std::nullopt; }

  size_t terminator = text_.find(kLineTerminator, cursor_);
  size_t content_end =
      terminator == std::string_view::npos ? text_.size() : terminator;
  size_t line_end =
      terminator == std::string_view::npos ? text_.size() : terminator + 1;

  Span line(cursor_, line_end);
  std::string_view content = text_.substr(cursor_, content_end - cursor_);

  std::optional<Match> match = options_.use_last_match
                                   ? matcher_.Last(content)
                                   : matcher_.First(content);
  size_t value_offset = 0;
  if (match) {
    value_offset = options_.start_after_match ? match->end : match->begin;
  }

  ScannedLine result{
      .line   = line,
      .value  = Span(cursor_ + value_offset, content_end),
      .column = utf8::CodePointCount(content.substr(0, value_offset)),
  };
  LOG("scan", "line [%u, %u) value [%u, %u) column %u", line.start(),
      line.stop(), result.value.start(), result.value.stop(), result.column);

  cursor_ = line_end;
  return result;
}

}  // namespace subtree
