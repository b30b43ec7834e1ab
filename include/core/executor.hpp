#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pacer::core {

// Fixed-size set of worker threads draining one FIFO. The adaptive pool
// replaces whole executors on resize instead of growing one in place.
class Executor {
 public:
  using Job = std::function<void()>;

  explicit Executor(std::size_t worker_count);
  ~Executor();

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  // Returns false once stop has been requested.
  bool post(Job job);

  // Workers finish whatever is queued, then exit. Does not block.
  void request_stop();

  // Drops queued jobs that have not started; returns how many were dropped.
  std::size_t discard_pending();

  void join();

  [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }
  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] std::size_t busy() const;
  [[nodiscard]] bool finished() const;

 private:
  void worker_loop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  std::vector<std::thread> workers_;
  std::size_t busy_{0};
  std::size_t exited_{0};
  bool stopping_{false};
};

}  // namespace pacer::core
