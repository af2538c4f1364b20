#ifndef SUBTREE_RENDER_THEME_H
#define SUBTREE_RENDER_THEME_H

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"

namespace subtree {

// The four strings used to draw the connectors in front of each node. The
// glyph drawn for a column is chosen by a two-bit slot value:
//   bit 0 is set once the column's node has been drawn, so that deeper lines
//         draw a continuation rather than another branch;
//   bit 1 is set when the column's node is the last child of its parent.
struct Theme {
  enum Slot : uint8_t {
    kBranch     = 0,
    kVertical   = 1,
    kLastBranch = 2,
    kBlank      = 3,
  };

  // Constructs a theme from exactly four glyphs, in slot order.
  static absl::StatusOr<Theme> FromGlyphs(
      absl::Span<std::string const> glyphs);

  explicit Theme(std::string branch, std::string vertical,
                 std::string last_branch, std::string blank)
      : glyphs_{std::move(branch), std::move(vertical),
                std::move(last_branch), std::move(blank)} {}

  std::string_view glyph(uint8_t slot) const { return glyphs_[slot & 3]; }

  // Returns a copy of this theme with every glyph wrapped in the terminal's
  // dim attribute.
  Theme Dimmed() const;

 private:
  std::array<std::string, 4> glyphs_;
};

// Returns the preset named `name`, or an `InvalidArgument` error naming every
// preset.
// Presets are built once and never modified, so the returned reference is
// valid for the life of the program.
absl::StatusOr<Theme const *> FindTheme(std::string_view name);

// Names of all presets, sorted.
std::vector<std::string_view> ThemeNames();

}  // namespace subtree

#endif  // SUBTREE_RENDER_THEME_H
