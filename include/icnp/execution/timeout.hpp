#pragma once

#include <icnp/execution/worker_pool.hpp>
#include <icnp/schema/primitives.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace icnp::execution {

/// Run a collaborator call, giving up after `timeout` milliseconds.
///
/// A timeout of zero, or no pool, runs the call on the calling thread.
/// Otherwise the call runs on `workers`; after a timeout its eventual result
/// is dropped, so `call` must own everything it touches. Returns
/// `std::nullopt` on timeout, when the pool refuses the call, or when the
/// call throws.
template <typename Result>
std::optional<Result> call_with_timeout(
    worker_pool* workers,
    const std::string& name,
    const icnp::schema::duration_milliseconds_t timeout,
    std::function<Result()> call) {
  if (timeout == 0 || !workers) {
    try {
      return call();
    } catch (const std::exception& e) {
      spdlog::error("Collaborator '{}' failed: {}", name, e.what());
      return std::nullopt;
    }
  }

  auto task = std::make_shared<std::packaged_task<Result()>>(std::move(call));
  auto future = task->get_future();
  if (!workers->submit([task]() { (*task)(); })) {
    spdlog::warn("Collaborator '{}' refused: {} call(s) already queued", name,
                 workers->pending());
    return std::nullopt;
  }

  if (future.wait_for(std::chrono::milliseconds{timeout}) !=
      std::future_status::ready) {
    spdlog::warn("Collaborator '{}' timed out after {} ms", name, timeout);
    return std::nullopt;
  }
  try {
    return future.get();
  } catch (const std::exception& e) {
    spdlog::error("Collaborator '{}' failed: {}", name, e.what());
    return std::nullopt;
  }
}

}  // namespace icnp::execution
