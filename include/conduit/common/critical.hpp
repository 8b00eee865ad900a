#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace conduit::common {

/// Log an unrecoverable failure, flush every sink and bring the process down.
/// Reserved for broken infrastructure (storage I/O, encoding of values the
/// process produced itself); contract level failures are reported through
/// result codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace conduit::common
