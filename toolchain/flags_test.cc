#include "toolchain/flags.h"

#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/reflection.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace subtree {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(OutputFormatFromFlag, Values) {
  EXPECT_EQ(OutputFormatFromFlag("plain").value(), OutputFormat::Plain);
  EXPECT_EQ(OutputFormatFromFlag("indices").value(), OutputFormat::Indices);
  EXPECT_EQ(OutputFormatFromFlag("json").value(), OutputFormat::Json);
  EXPECT_EQ(OutputFormatFromFlag("yaml").status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(RootVisibilityFromFlag, Values) {
  EXPECT_EQ(RootVisibilityFromFlag("auto").value(), RootVisibility::Auto);
  EXPECT_EQ(RootVisibilityFromFlag("show").value(), RootVisibility::Show);
  EXPECT_EQ(RootVisibilityFromFlag("hide").value(), RootVisibility::Hide);
  EXPECT_EQ(RootVisibilityFromFlag("").status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(ThemeFromFlags, NoThemeByDefault) {
  auto theme = ThemeFromFlags("", {});
  ASSERT_TRUE(theme.ok());
  EXPECT_FALSE(theme->has_value());
}

TEST(ThemeFromFlags, Preset) {
  auto theme = ThemeFromFlags("rounded", {});
  ASSERT_TRUE(theme.ok());
  ASSERT_TRUE(theme->has_value());
  EXPECT_EQ((*theme)->glyph(Theme::kLastBranch), "╰── ");
}

TEST(ThemeFromFlags, Glyphs) {
  std::vector<std::string> glyphs = {"+ ", "| ", "\\ ", "  "};
  auto theme                      = ThemeFromFlags("", glyphs);
  ASSERT_TRUE(theme.ok());
  ASSERT_TRUE(theme->has_value());
  EXPECT_EQ((*theme)->glyph(Theme::kLastBranch), "\\ ");
}

TEST(ThemeFromFlags, Errors) {
  std::vector<std::string> glyphs = {"+ ", "| ", "\\ ", "  "};
  EXPECT_EQ(ThemeFromFlags("single", glyphs).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(ThemeFromFlags("", std::vector<std::string>{"a"}).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(ThemeFromFlags("nope", {}).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(Options, DefaultRootVisibility) {
  Options options;
  EXPECT_FALSE(options.show_root());
  options.path.push_back(PathComponent::Index(0));
  EXPECT_TRUE(options.show_root());
  options.root = RootVisibility::Hide;
  EXPECT_FALSE(options.show_root());
  options.path.clear();
  options.root = RootVisibility::Show;
  EXPECT_TRUE(options.show_root());
}

TEST(OptionsFromFlags, Defaults) {
  absl::FlagSaver saver;
  auto options = OptionsFromFlags({});
  ASSERT_TRUE(options.ok()) << options.status();
  EXPECT_NE(options->matcher, nullptr);
  EXPECT_FALSE(options->scan.use_last_match);
  EXPECT_FALSE(options->scan.start_after_match);
  EXPECT_FALSE(options->theme.has_value());
  EXPECT_EQ(options->root, RootVisibility::Auto);
  EXPECT_EQ(options->format, OutputFormat::Plain);
  EXPECT_TRUE(options->path.empty());
}

TEST(OptionsFromFlags, ReadsFlagsAndPath) {
  absl::FlagSaver saver;
  absl::SetFlag(&FLAGS_pattern, "[a-z]");
  absl::SetFlag(&FLAGS_after, true);
  absl::SetFlag(&FLAGS_last, true);
  absl::SetFlag(&FLAGS_theme, "ascii");
  absl::SetFlag(&FLAGS_root, "hide");
  absl::SetFlag(&FLAGS_format, "json");

  std::vector<std::string> arguments = {"1", "name", "\\2"};
  auto options                       = OptionsFromFlags(arguments);
  ASSERT_TRUE(options.ok()) << options.status();
  EXPECT_TRUE(options->scan.use_last_match);
  EXPECT_TRUE(options->scan.start_after_match);
  EXPECT_TRUE(options->theme.has_value());
  EXPECT_EQ(options->root, RootVisibility::Hide);
  EXPECT_EQ(options->format, OutputFormat::Json);
  EXPECT_THAT(options->path, ElementsAre(PathComponent::Index(1),
                                         PathComponent::Text("name"),
                                         PathComponent::Text("2")));
}

TEST(OptionsFromFlags, BadPattern) {
  absl::FlagSaver saver;
  absl::SetFlag(&FLAGS_pattern, "[");
  auto options = OptionsFromFlags({});
  EXPECT_EQ(options.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(options.status().message(), HasSubstr("regular expression"));
}

TEST(OptionsFromFlags, BadFormat) {
  absl::FlagSaver saver;
  absl::SetFlag(&FLAGS_format, "xml");
  EXPECT_EQ(OptionsFromFlags({}).status().code(),
            absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace subtree
