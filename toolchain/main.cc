#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/symbolize.h"
#include "absl/flags/flag.h"
#include "absl/status/statusor.h"
#include "base/file.h"
#include "base/log.h"
#include "render/theme.h"
#include "toolchain/flags.h"
#include "toolchain/subtree.h"

namespace subtree {
namespace {

absl::StatusOr<std::string> ReadInput(std::string const &input) {
  if (input == "-") { return base::ReadStreamToString(stdin); }
  return base::ReadFileToString(input);
}

int Main(std::vector<std::string> const &arguments) {
  for (std::string const &key : absl::GetFlag(FLAGS_log)) {
    base::EnableLogging(key);
  }

  if (absl::GetFlag(FLAGS_list_themes)) {
    for (std::string_view name : ThemeNames()) { std::cout << name << '\n'; }
    return 0;
  }

  absl::StatusOr<Options> options = OptionsFromFlags(arguments);
  if (not options.ok()) {
    std::cerr << options.status().message() << std::endl;
    return 1;
  }
  options->interactive = ::isatty(STDOUT_FILENO);

  absl::StatusOr<std::string> input = ReadInput(absl::GetFlag(FLAGS_input));
  if (not input.ok()) {
    std::cerr << input.status().message() << std::endl;
    return 1;
  }

  if (absl::Status status = Run(*options, *input, std::cout); not status.ok()) {
    std::cout.flush();
    std::cerr << status.message() << std::endl;
    return 1;
  }
  std::cout.flush();
  return std::cout ? 0 : 1;
}

}  // namespace
}  // namespace subtree

int main(int argc, char *argv[]) {
  subtree::InitializeFlags(subtree::kUsage);
  std::vector<std::string> arguments = subtree::ParseCommandLine(argc, argv);
  absl::InitializeSymbolizer(argv[0]);
  absl::FailureSignalHandlerOptions opts;
  absl::InstallFailureSignalHandler(opts);

  return subtree::Main(arguments);
}
