#include "render/theme.h"

#include <algorithm>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "base/no_destructor.h"

namespace subtree {
namespace {

constexpr std::string_view kDim   = "\033[2m";
constexpr std::string_view kReset = "\033[0m";

using ThemeTable = absl::flat_hash_map<std::string, Theme>;

struct Preset {
  std::string_view name;
  std::string_view branch, vertical, last_branch, blank;
};

// Presets drawn with visible glyphs. Each also gets a "dark-" variant.
constexpr Preset kGlyphPresets[] = {
    {"ascii", "|-- ", "|   ", "`-- ", "    "},
    {"single", "├── ", "│   ", "└── ", "    "},
    {"double", "╠══ ", "║   ", "╚══ ", "    "},
    {"heavy", "┣━━ ", "┃   ", "┗━━ ", "    "},
    {"rounded", "├── ", "│   ", "╰── ", "    "},
};

// Presets that indent with whitespace only.
constexpr Preset kWhitespacePresets[] = {
    {"space2", "  ", "  ", "  ", "  "},
    {"space4", "    ", "    ", "    ", "    "},
    {"tab", "\t", "\t", "\t", "\t"},
};

Theme ThemeFor(Preset const &p) {
  return Theme(std::string(p.branch), std::string(p.vertical),
               std::string(p.last_branch), std::string(p.blank));
}

ThemeTable MakeThemeTable() {
  ThemeTable table;
  for (Preset const &p : kGlyphPresets) {
    Theme theme = ThemeFor(p);
    table.emplace(absl::StrCat("dark-", p.name), theme.Dimmed());
    table.emplace(p.name, std::move(theme));
  }
  for (Preset const &p : kWhitespacePresets) {
    table.emplace(p.name, ThemeFor(p));
  }
  return table;
}

ThemeTable const &Themes() {
  static base::NoDestructor<ThemeTable const> table(MakeThemeTable());
  return *table;
}

}  // namespace

absl::StatusOr<Theme> Theme::FromGlyphs(absl::Span<std::string const> glyphs) {
  if (glyphs.size() != 4) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "A theme requires exactly four glyphs (branch, vertical, last branch, "
        "blank) but %d were given.",
        glyphs.size()));
  }
  return Theme(glyphs[0], glyphs[1], glyphs[2], glyphs[3]);
}

Theme Theme::Dimmed() const {
  auto dim = [](std::string_view g) { return absl::StrCat(kDim, g, kReset); };
  return Theme(dim(glyphs_[kBranch]), dim(glyphs_[kVertical]),
               dim(glyphs_[kLastBranch]), dim(glyphs_[kBlank]));
}

absl::StatusOr<Theme const *> FindTheme(std::string_view name) {
  auto const &themes = Themes();
  if (auto iter = themes.find(name); iter != themes.end()) {
    return &iter->second;
  }
  return absl::InvalidArgumentError(
      absl::StrFormat(R"(No theme named "%s". Available themes: %s)", name,
                      absl::StrJoin(ThemeNames(), ", ")));
}

std::vector<std::string_view> ThemeNames() {
  std::vector<std::string_view> names;
  for (auto const &[name, theme] : Themes()) { names.push_back(name); }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace subtree
