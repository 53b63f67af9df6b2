#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace icnp::common {

/// Log an unrecoverable invariant breach, flush every sink and terminate.
///
/// Reserved for states the engine cannot reason about (storage that cannot be
/// opened, decoding bytes the engine itself produced). Protocol-level failures
/// are reported through `operation_result_t` instead.
[[noreturn]] inline void critical(const std::string_view component,
                                  const std::string_view message) {
  spdlog::critical("[{}] {}", component, message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace icnp::common
