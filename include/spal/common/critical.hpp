#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace spal::common {

/// Log and terminate. Reserved for violated preconditions that callers were
/// expected to rule out (e.g. handing non-hex text to `from_hex`).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace spal::common
