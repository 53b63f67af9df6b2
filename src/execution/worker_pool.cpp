#include <icnp/execution/worker_pool.hpp>

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace icnp::execution {

worker_pool::worker_pool(const std::size_t threads,
                         const std::size_t max_pending)
    : max_pending_(max_pending) {
  threads_.reserve(threads);
  for (auto i = std::size_t{0}; i < threads; ++i) {
    threads_.emplace_back([this] { run(); });
  }
  spdlog::debug("Collaborator pool started with {} thread(s), {} queued max",
                threads, max_pending);
}

worker_pool::~worker_pool() {
  {
    auto lock = std::scoped_lock{mutex_};
    stopping_ = true;
  }
  ready_.notify_all();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

bool worker_pool::submit(std::function<void()> task) {
  {
    auto lock = std::scoped_lock{mutex_};
    if (stopping_ || threads_.empty() || pending_.size() >= max_pending_) {
      return false;
    }
    pending_.push_back(std::move(task));
  }
  ready_.notify_one();
  return true;
}

std::size_t worker_pool::threads() const {
  return threads_.size();
}

std::size_t worker_pool::pending() const {
  auto lock = std::scoped_lock{mutex_};
  return pending_.size();
}

void worker_pool::run() {
  while (true) {
    auto task = std::function<void()>{};
    {
      auto lock = std::unique_lock{mutex_};
      ready_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
      if (pending_.empty()) {
        return;
      }
      task = std::move(pending_.front());
      pending_.pop_front();
    }
    try {
      task();
    } catch (const std::exception& e) {
      spdlog::error("Collaborator task failed: {}", e.what());
    }
  }
}

}  // namespace icnp::execution
