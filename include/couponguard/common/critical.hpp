#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace couponguard::common {

/// Log, flush and terminate. Reserved for faults the engine cannot report as
/// a result value (storage unusable, atomic batch rejected by the backend).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace couponguard::common
