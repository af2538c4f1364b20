#include "base/file.h"

#include <cerrno>
#include <cstring>

#include "absl/cleanup/cleanup.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"

namespace base {

absl::StatusOr<std::string> ReadStreamToString(std::FILE *file) {
  std::string result;
  char buffer[4096];
  while (size_t n = std::fread(buffer, 1, sizeof(buffer), file)) {
    result.append(buffer, n);
  }
  if (std::ferror(file)) {
    return absl::DataLossError(
        absl::StrFormat("Failed to read input: %s", std::strerror(errno)));
  }
  return result;
}

absl::StatusOr<std::string> ReadFileToString(std::string const &file_name) {
  std::FILE *file = std::fopen(file_name.c_str(), "rb");
  if (not file) {
    return absl::NotFoundError(absl::StrFormat(
        R"(Failed to open file "%s": %s)", file_name, std::strerror(errno)));
  }
  absl::Cleanup closer = [&] { std::fclose(file); };
  return ReadStreamToString(file);
}

}  // namespace base
