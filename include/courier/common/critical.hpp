#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace courier::common {

/// Log, flush and terminate. Reserved for host-level corruption (storage
/// failures, undecodable committed state) that no transaction can recover
/// from.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace courier::common
