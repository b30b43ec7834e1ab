#include "core/executor.hpp"

#include <utility>

namespace pacer::core {

Executor::Executor(const std::size_t worker_count) {
  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers_.emplace_back(&Executor::worker_loop, this);
  }
}

Executor::~Executor() {
  request_stop();
  join();
}

bool Executor::post(Job job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return false;
    }
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

void Executor::request_stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
}

std::size_t Executor::discard_pending() {
  std::deque<Job> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped.swap(jobs_);
  }
  // Destroyed outside the lock: a dropped packaged_task breaks its promise here.
  return dropped.size();
}

void Executor::join() {
  for (auto& worker : workers_) {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
      worker.join();
    }
  }
}

std::size_t Executor::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

std::size_t Executor::busy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return busy_;
}

bool Executor::finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exited_ == workers_.size();
}

void Executor::worker_loop() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });

      if (jobs_.empty()) {
        ++exited_;
        return;
      }

      job = std::move(jobs_.front());
      jobs_.pop_front();
      ++busy_;
    }

    if (job) {
      job();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    --busy_;
  }
}

}  // namespace pacer::core
