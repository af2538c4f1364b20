#include "base/log.h"

namespace base {
void EnableLogging(std::string_view key) {
  absl::MutexLock lock(&internal_logging::registry_mutex);
  internal_logging::enabled_keys.emplace(key);
  if (auto iter = internal_logging::switches.find(key);
      iter != internal_logging::switches.end()) {
    for (auto *ptr : iter->second) {
      ptr->store(true, std::memory_order_relaxed);
    }
  }
}

namespace internal_logging {

bool Register(std::string_view key, std::atomic<bool> *log_switch) {
  absl::MutexLock lock(&registry_mutex);
  switches[key].push_back(log_switch);
  return enabled_keys.contains(key);
}

}  // namespace internal_logging

}  // namespace base
