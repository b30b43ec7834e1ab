#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "core/worker_pool.hpp"

namespace pacer::core {

struct RetryPolicy {
  unsigned max_retries{3};
  double backoff_factor{1.0};
};

// Sequential retry and wave-batched dispatch on top of the adaptive pool.
class TaskScheduler {
 public:
  explicit TaskScheduler(AdaptiveWorkerPool& pool, RetryPolicy default_policy = {});

  // Pause before retry number attempt + 1 (attempt is 0-based).
  [[nodiscard]] static std::chrono::duration<double> backoff_delay(double backoff_factor, unsigned attempt);

  // Runs work on the pool and blocks for its result. A failed attempt sleeps
  // backoff_factor * 2^attempt seconds and retries; after max_retries failed
  // retries the last exception reaches the caller.
  template <typename F>
  auto schedule_with_backoff(F work, unsigned max_retries, double backoff_factor) -> std::invoke_result_t<F&>;

  template <typename F>
  auto schedule_with_backoff(F work) -> std::invoke_result_t<F&> {
    return schedule_with_backoff(std::move(work), default_policy_.max_retries, default_policy_.backoff_factor);
  }

  // Dispatches tasks in consecutive waves of max_concurrent (default: the
  // pool's current worker count), draining each wave before the next.
  template <typename R>
  std::vector<std::optional<R>> schedule_batch(const std::vector<std::function<R()>>& tasks,
                                               std::optional<std::size_t> max_concurrent = std::nullopt);

 private:
  AdaptiveWorkerPool& pool_;
  RetryPolicy default_policy_;
};

template <typename F>
auto TaskScheduler::schedule_with_backoff(F work, const unsigned max_retries, const double backoff_factor)
    -> std::invoke_result_t<F&> {
  for (unsigned attempt = 0;; ++attempt) {
    std::string reason;
    try {
      return pool_.submit([&work]() { return work(); }).get();
    } catch (const std::exception& ex) {
      if (attempt >= max_retries || pool_.is_shut_down()) {
        std::cerr << "[scheduler] giving up after " << (attempt + 1) << " attempts: " << ex.what() << '\n';
        throw;
      }
      reason = ex.what();
    } catch (...) {
      if (attempt >= max_retries || pool_.is_shut_down()) {
        std::cerr << "[scheduler] giving up after " << (attempt + 1) << " attempts: unknown error\n";
        throw;
      }
      reason = "unknown error";
    }
    std::cerr << "[scheduler] attempt " << (attempt + 1) << " failed: " << reason << "; retrying\n";
    std::this_thread::sleep_for(backoff_delay(backoff_factor, attempt));
  }
}

template <typename R>
std::vector<std::optional<R>> TaskScheduler::schedule_batch(const std::vector<std::function<R()>>& tasks,
                                                            std::optional<std::size_t> max_concurrent) {
  std::size_t wave_size = max_concurrent.value_or(pool_.current_worker_count());
  if (wave_size == 0) {
    wave_size = 1;
  }

  std::vector<std::optional<R>> results(tasks.size());
  for (std::size_t wave_start = 0; wave_start < tasks.size(); wave_start += wave_size) {
    const std::size_t wave_end = std::min(tasks.size(), wave_start + wave_size);

    std::vector<std::future<R>> wave;
    wave.reserve(wave_end - wave_start);
    for (std::size_t i = wave_start; i < wave_end; ++i) {
      wave.push_back(pool_.submit(tasks[i]));
    }

    for (std::size_t i = 0; i < wave.size(); ++i) {
      try {
        results[wave_start + i] = wave[i].get();
      } catch (const std::exception& ex) {
        std::cerr << "[scheduler] batch task failed: " << ex.what() << '\n';
      } catch (...) {
        std::cerr << "[scheduler] batch task failed: unknown error\n";
      }
    }
  }
  return results;
}

}  // namespace pacer::core
