#include "text/matcher.h"

#include <iterator>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "text/utf8.h"

namespace subtree {
namespace {

bool IsWhitespace(char32_t c) {
  switch (c) {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case 0x85:
    case 0xa0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202f:
    case 0x205f:
    case 0x3000: return true;
    default: return 0x2000 <= c and c <= 0x200a;
  }
}

}  // namespace

std::optional<Match> IndentationMatcher::First(std::string_view line) const {
  size_t offset = 0;
  while (offset < line.size()) {
    utf8::Decoded d = utf8::DecodeAt(line, offset);
    if (not IsWhitespace(d.code_point) and
        not utf8::IsBoxDrawing(d.code_point)) {
      return Match{.begin = offset, .end = offset + d.length};
    }
    offset += d.length;
  }
  return Match{.begin = line.size(), .end = line.size()};
}

std::optional<Match> IndentationMatcher::Last(std::string_view line) const {
  // The end-of-line alternative always matches, and always matches last.
  return Match{.begin = line.size(), .end = line.size()};
}

absl::StatusOr<std::unique_ptr<RegexMatcher>> RegexMatcher::Make(
    std::string_view pattern) {
  try {
    std::regex regex(pattern.begin(), pattern.end(), std::regex::ECMAScript);
    return std::unique_ptr<RegexMatcher>(new RegexMatcher(std::move(regex)));
  } catch (std::regex_error const &e) {
    return absl::InvalidArgumentError(absl::StrFormat(
        R"(Invalid regular expression "%s": %s)", pattern, e.what()));
  }
}

std::optional<Match> RegexMatcher::First(std::string_view line) const {
  std::cmatch m;
  if (not std::regex_search(line.data(), line.data() + line.size(), m,
                            regex_)) {
    return std::nullopt;
  }
  size_t begin = m.position(0);
  return Match{.begin = begin, .end = begin + m.length(0)};
}

std::optional<Match> RegexMatcher::Last(std::string_view line) const {
  std::cregex_iterator iter(line.data(), line.data() + line.size(), regex_);
  std::cregex_iterator end;
  std::optional<Match> result;
  for (; iter != end; ++iter) {
    size_t begin = iter->position(0);
    result       = Match{.begin = begin, .end = begin + iter->length(0)};
  }
  return result;
}

absl::StatusOr<std::unique_ptr<Matcher>> MakeMatcher(std::string_view pattern) {
  if (pattern.empty()) { return std::make_unique<IndentationMatcher>(); }
  absl::StatusOr<std::unique_ptr<RegexMatcher>> regex =
      RegexMatcher::Make(pattern);
  if (not regex.ok()) { return std::move(regex).status(); }
  return std::unique_ptr<Matcher>(*std::move(regex));
}

}  // namespace subtree
