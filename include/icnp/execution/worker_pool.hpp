#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace icnp::execution {

/// Fixed set of threads running collaborator calls under a deadline.
///
/// At most `max_pending` tasks wait for a thread; further submissions are
/// refused, so a collaborator that hangs can tie up the pool but never grow
/// it. Queued tasks are drained and the threads joined on destruction.
class worker_pool final {
 public:
  worker_pool(std::size_t threads, std::size_t max_pending);
  ~worker_pool();

  worker_pool(const worker_pool&) = delete;
  worker_pool& operator=(const worker_pool&) = delete;

  /// Queue `task`. False when the queue is full or the pool is stopping.
  bool submit(std::function<void()> task);

  std::size_t threads() const;
  std::size_t pending() const;

 private:
  void run();

  std::size_t max_pending_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<std::function<void()>> pending_;
  bool stopping_{};
  std::vector<std::thread> threads_;
};

}  // namespace icnp::execution
