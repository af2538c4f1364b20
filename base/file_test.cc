#include "base/file.h"

#include <cstdio>
#include <string>

#include "gtest/gtest.h"

namespace base {
namespace {

std::string WriteTempFile(std::string const &name, std::string const &content) {
  std::string path = ::testing::TempDir() + name;
  std::FILE *f     = std::fopen(path.c_str(), "wb");
  EXPECT_NE(f, nullptr);
  if (f) {
    std::fwrite(content.data(), 1, content.size(), f);
    std::fclose(f);
  }
  return path;
}

TEST(ReadFileToString, MissingFile) {
  auto content = ReadFileToString(::testing::TempDir() + "does/not/exist");
  EXPECT_EQ(content.status().code(), absl::StatusCode::kNotFound);
}

TEST(ReadFileToString, EmptyFile) {
  auto content = ReadFileToString(WriteTempFile("empty.txt", ""));
  ASSERT_TRUE(content.ok()) << content.status();
  EXPECT_EQ(*content, "");
}

TEST(ReadFileToString, PreservesBytes) {
  std::string data = "a\n  b\r\n\0c";
  data.push_back('\0');
  data += std::string(10000, 'x');
  auto content = ReadFileToString(WriteTempFile("bytes.txt", data));
  ASSERT_TRUE(content.ok()) << content.status();
  EXPECT_EQ(*content, data);
}

}  // namespace
}  // namespace base
