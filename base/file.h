#ifndef SUBTREE_BASE_FILE_H
#define SUBTREE_BASE_FILE_H

#include <cstdio>
#include <string>

#include "absl/status/statusor.h"

namespace base {

// Reads everything remaining in `file` and returns it. Works for pipes and
// terminals as well as regular files. Does not close `file`.
absl::StatusOr<std::string> ReadStreamToString(std::FILE *file);

// Reads the file named `file_name` in its entirety. Returns a `NotFound` error
// if the file cannot be opened.
absl::StatusOr<std::string> ReadFileToString(std::string const &file_name);

}  // namespace base

#endif  // SUBTREE_BASE_FILE_H
