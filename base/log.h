#ifndef SUBTREE_BASE_LOG_H
#define SUBTREE_BASE_LOG_H

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"

namespace base {

namespace internal_logging {

// Guards the key registry below. Every `LOG` call site registers its switch
// here the first time it executes so that later calls to `EnableLogging` can
// flip it.
inline absl::Mutex registry_mutex;
inline absl::flat_hash_map<std::string_view, std::vector<std::atomic<bool> *>>
    switches ABSL_GUARDED_BY(registry_mutex);
inline absl::flat_hash_set<std::string> enabled_keys
    ABSL_GUARDED_BY(registry_mutex);

ABSL_CONST_INIT inline absl::Mutex output_mutex(absl::kConstInit);

bool Register(std::string_view key, std::atomic<bool> *log_switch);

template <typename... Args>
void Log(std::string_view key, std::source_location loc,
         absl::FormatSpec<Args...> const &fmt, Args const &...args) {
  absl::MutexLock lock(&output_mutex);
  absl::FPrintF(stderr, "\033[0;1;34m[%s %s:%u] \033[0m", key,
                std::string_view(loc.file_name()),
                static_cast<uint32_t>(loc.line()));
  absl::FPrintF(stderr, fmt, args...);
  std::fputc('\n', stderr);
}

}  // namespace internal_logging

void EnableLogging(std::string_view key);

// Logs to stderr under the key `k` if that key has been enabled. The format
// string is checked against the arguments by `absl::StrFormat`.
#define LOG(k, fmt, ...)                                                       \
  do {                                                                         \
    static std::atomic<bool> subtree_log_switch_(                              \
        ::base::internal_logging::Register(k, &subtree_log_switch_));          \
    if (subtree_log_switch_.load(std::memory_order_relaxed)) {                 \
      ::base::internal_logging::Log(                                           \
          k, ::std::source_location::current(), fmt __VA_OPT__(, )             \
                                                    __VA_ARGS__);              \
    }                                                                          \
  } while (false)

}  // namespace base

#endif  // SUBTREE_BASE_LOG_H
