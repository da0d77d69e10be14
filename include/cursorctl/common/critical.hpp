#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cursorctl::common {

/// Log, flush and terminate. Reserved for states the process cannot recover
/// from (encoder invariants, entropy source failure).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace cursorctl::common
