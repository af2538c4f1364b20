#include "toolchain/flags.h"

#include <utility>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/flags/usage_config.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_format.h"

ABSL_FLAG(std::string, pattern, "",
          "ECMAScript regular expression marking where each line's value "
          "begins. Defaults to the first character that is neither whitespace "
          "nor a box-drawing character.");
ABSL_FLAG(bool, after, false,
          "Start each value after the match rather than at its beginning.");
ABSL_FLAG(bool, last, false,
          "Use the last match on each line rather than the first.");
ABSL_FLAG(std::string, theme, "",
          "Draw the tree with the named theme. See --list_themes. When empty, "
          "the tree is reproduced as-is.");
ABSL_FLAG(std::vector<std::string>, glyphs, {},
          "Draw the tree with four comma-separated glyphs: branch, vertical, "
          "last branch and blank.");
ABSL_FLAG(bool, list_themes, false, "List the available themes and exit.");
ABSL_FLAG(std::string, root, "auto",
          "Whether to print the root of the selected tree. Options: auto "
          "(default; shown only when a path is given), show, or hide.");
ABSL_FLAG(std::string, format, "plain",
          "Output format. Options: plain (default), indices, or json.");
ABSL_FLAG(std::string, input, "-",
          "File to read the tree from, or - (default) for standard input.");
ABSL_FLAG(std::vector<std::string>, log, {},
          "Comma-separated list of log keys (scan, build, path, render).");

namespace subtree {
namespace {

bool HelpFilter(std::string_view module) {
  return absl::EndsWith(module, "toolchain/flags.cc");
}

}  // namespace

void InitializeFlags(std::string_view program_usage) {
  absl::FlagsUsageConfig flag_config;
  flag_config.contains_helpshort_flags = &HelpFilter;
  flag_config.contains_help_flags      = &HelpFilter;
  absl::SetFlagsUsageConfig(flag_config);
  absl::SetProgramUsageMessage(program_usage);
}

std::vector<std::string> ParseCommandLine(int argc, char *argv[]) {
  std::vector<char *> args = absl::ParseCommandLine(argc, argv);
  return std::vector<std::string>(args.begin() + 1, args.end());
}

absl::StatusOr<OutputFormat> OutputFormatFromFlag(std::string_view value) {
  if (value == "plain") { return OutputFormat::Plain; }
  if (value == "indices") { return OutputFormat::Indices; }
  if (value == "json") { return OutputFormat::Json; }
  return absl::InvalidArgumentError(absl::StrFormat(
      "Invalid value for --format flag '%s'. Valid values are 'plain', "
      "'indices' or 'json'.",
      value));
}

absl::StatusOr<RootVisibility> RootVisibilityFromFlag(std::string_view value) {
  if (value == "auto") { return RootVisibility::Auto; }
  if (value == "show") { return RootVisibility::Show; }
  if (value == "hide") { return RootVisibility::Hide; }
  return absl::InvalidArgumentError(absl::StrFormat(
      "Invalid value for --root flag '%s'. Valid values are 'auto', 'show' or "
      "'hide'.",
      value));
}

absl::StatusOr<std::optional<Theme>> ThemeFromFlags(
    std::string_view name, absl::Span<std::string const> glyphs) {
  if (not name.empty() and not glyphs.empty()) {
    return absl::InvalidArgumentError(
        "At most one of --theme and --glyphs may be given.");
  }
  if (not glyphs.empty()) {
    absl::StatusOr<Theme> theme = Theme::FromGlyphs(glyphs);
    if (not theme.ok()) { return std::move(theme).status(); }
    return std::optional<Theme>(*std::move(theme));
  }
  if (name.empty()) { return std::optional<Theme>(); }
  absl::StatusOr<Theme const *> preset = FindTheme(name);
  if (not preset.ok()) { return std::move(preset).status(); }
  return std::optional<Theme>(**preset);
}

absl::StatusOr<Options> OptionsFromFlags(
    absl::Span<std::string const> arguments) {
  Options options;

  auto matcher = MakeMatcher(absl::GetFlag(FLAGS_pattern));
  if (not matcher.ok()) { return std::move(matcher).status(); }
  options.matcher = *std::move(matcher);

  options.scan = {
      .use_last_match    = absl::GetFlag(FLAGS_last),
      .start_after_match = absl::GetFlag(FLAGS_after),
  };

  auto theme = ThemeFromFlags(absl::GetFlag(FLAGS_theme),
                              absl::GetFlag(FLAGS_glyphs));
  if (not theme.ok()) { return std::move(theme).status(); }
  options.theme = *std::move(theme);

  auto root = RootVisibilityFromFlag(absl::GetFlag(FLAGS_root));
  if (not root.ok()) { return std::move(root).status(); }
  options.root = *root;

  auto format = OutputFormatFromFlag(absl::GetFlag(FLAGS_format));
  if (not format.ok()) { return std::move(format).status(); }
  options.format = *format;

  auto path = ParsePath(arguments);
  if (not path.ok()) { return std::move(path).status(); }
  options.path = *std::move(path);

  return options;
}

}  // namespace subtree
