#ifndef SUBTREE_TOOLCHAIN_FLAGS_H
#define SUBTREE_TOOLCHAIN_FLAGS_H

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/flags/declare.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "render/theme.h"
#include "text/line_scanner.h"
#include "text/matcher.h"
#include "tree/path.h"

ABSL_DECLARE_FLAG(std::string, pattern);
ABSL_DECLARE_FLAG(bool, after);
ABSL_DECLARE_FLAG(bool, last);
ABSL_DECLARE_FLAG(std::string, theme);
ABSL_DECLARE_FLAG(std::vector<std::string>, glyphs);
ABSL_DECLARE_FLAG(bool, list_themes);
ABSL_DECLARE_FLAG(std::string, root);
ABSL_DECLARE_FLAG(std::string, format);
ABSL_DECLARE_FLAG(std::string, input);
ABSL_DECLARE_FLAG(std::vector<std::string>, log);

namespace subtree {

enum class OutputFormat { Plain, Indices, Json };
enum class RootVisibility { Auto, Show, Hide };

// Everything needed to turn an input buffer into output, validated and ready
// to use.
struct Options {
  std::unique_ptr<Matcher> matcher;
  ScanOptions scan;
  // Absent when the tree should be reproduced as-is.
  std::optional<Theme> theme;
  RootVisibility root = RootVisibility::Auto;
  OutputFormat format = OutputFormat::Plain;
  std::vector<PathComponent> path;
  // Set when output goes to a terminal.
  bool interactive = false;

  // The root is hidden by default when no path is given, since the root of a
  // whole document is synthetic. A selected node is shown by default.
  bool show_root() const {
    switch (root) {
      case RootVisibility::Show: return true;
      case RootVisibility::Hide: return false;
      case RootVisibility::Auto: return not path.empty();
    }
    return false;
  }
};

inline constexpr std::string_view kUsage =
    "Reconstructs the tree drawn by indentation in the input and prints the "
    "subtree selected by the given path.\n"
    "Usage: subtree [flags] [--] [path component...]\n"
    "Path components beginning with '-', such as the negative index -1, must "
    "follow '--'.";

void InitializeFlags(std::string_view program_usage);

// Sets every flag named in `argv` and returns the remaining positional
// arguments, excluding the program name. Everything after a `--` argument is
// positional. Exits the process on an unknown or malformed flag.
std::vector<std::string> ParseCommandLine(int argc, char *argv[]);

absl::StatusOr<OutputFormat> OutputFormatFromFlag(std::string_view value);
absl::StatusOr<RootVisibility> RootVisibilityFromFlag(std::string_view value);

// Selects the theme named by `--theme` or spelled out by `--glyphs`. The two
// are mutually exclusive. Returns `std::nullopt` if neither is set.
absl::StatusOr<std::optional<Theme>> ThemeFromFlags(
    std::string_view name, absl::Span<std::string const> glyphs);

// Validates the current flag values and builds `Options` from them. The
// positional `arguments` are path components.
absl::StatusOr<Options> OptionsFromFlags(
    absl::Span<std::string const> arguments);

}  // namespace subtree

#endif  // SUBTREE_TOOLCHAIN_FLAGS_H
