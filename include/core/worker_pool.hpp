#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/executor.hpp"
#include "core/resource_sampler.hpp"
#include "model/resource_snapshot.hpp"

namespace pacer::core {

struct PoolOptions {
  std::size_t min_workers{2};
  std::size_t max_workers{20};
  float cpu_threshold{80.0F};
  float memory_threshold{80.0F};
};

struct PoolState {
  std::size_t min_workers;
  std::size_t max_workers;
  std::size_t current_workers;
  float cpu_threshold;
  float memory_threshold;
  std::uint64_t generation;
};

// Worker pool whose capacity follows host load. Starts at min_workers and
// moves in steps of two within [min_workers, max_workers]. A resize swaps in
// a fresh Executor; work already handed to the previous one finishes there.
class AdaptiveWorkerPool {
 public:
  using SnapshotObserver = std::function<void(const model::resource_snapshot&, std::size_t current_workers)>;

  explicit AdaptiveWorkerPool(PoolOptions options = {}, std::unique_ptr<ResourceSampler> sampler = nullptr,
                              SnapshotObserver observer = {});
  ~AdaptiveWorkerPool();

  AdaptiveWorkerPool(const AdaptiveWorkerPool&) = delete;
  AdaptiveWorkerPool& operator=(const AdaptiveWorkerPool&) = delete;

  template <typename F, typename... Args>
  auto submit(F&& work, Args&&... args) -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>;

  // Slot i holds the result for items[i]; a failed item leaves its slot empty.
  template <typename F, typename T>
  auto map(F work, const std::vector<T>& items) -> std::vector<std::optional<std::invoke_result_t<F&, const T&>>>;

  // Sizing step run on every sample. Returns true when the worker count changed.
  bool adjust_workers(float cpu_percent, float memory_percent);

  [[nodiscard]] std::size_t current_worker_count() const;
  [[nodiscard]] PoolState state() const;
  [[nodiscard]] std::size_t pending_queue_depth() const;
  [[nodiscard]] std::size_t active_worker_count() const;
  [[nodiscard]] LoadGauge load() const;
  [[nodiscard]] model::resource_snapshot current_snapshot();
  [[nodiscard]] ResourceSampler* sampler() noexcept { return sampler_.get(); }

  void shutdown(bool wait = true);
  [[nodiscard]] bool is_shut_down() const noexcept { return shut_down_.load(); }

 private:
  void post(Executor::Job job);
  void rebuild_locked();
  void reap_retired_locked();
  void on_snapshot(const model::resource_snapshot& snapshot);

  PoolOptions options_;
  mutable std::mutex mutex_;
  std::size_t current_workers_;
  std::uint64_t generation_{0};
  std::shared_ptr<Executor> executor_;
  std::vector<std::shared_ptr<Executor>> retired_;
  std::atomic<bool> shut_down_{false};

  std::unique_ptr<ResourceSampler> sampler_;
  SnapshotObserver observer_;
};

template <typename F, typename... Args>
auto AdaptiveWorkerPool::submit(F&& work, Args&&... args)
    -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>> {
  using Result = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

  auto task = std::make_shared<std::packaged_task<Result()>>(
      [fn = std::forward<F>(work), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
        return std::apply(fn, std::move(bound));
      });
  auto future = task->get_future();
  post([task]() { (*task)(); });
  return future;
}

template <typename F, typename T>
auto AdaptiveWorkerPool::map(F work, const std::vector<T>& items)
    -> std::vector<std::optional<std::invoke_result_t<F&, const T&>>> {
  using Result = std::invoke_result_t<F&, const T&>;
  static_assert(!std::is_void_v<Result>, "map needs a value-returning work function");

  std::vector<std::future<Result>> futures;
  futures.reserve(items.size());
  for (const auto& item : items) {
    futures.push_back(submit([work, item]() mutable { return work(item); }));
  }

  std::vector<std::optional<Result>> results(items.size());
  for (std::size_t i = 0; i < futures.size(); ++i) {
    try {
      results[i] = futures[i].get();
    } catch (const std::exception& ex) {
      std::cerr << "[pool] task failed: " << ex.what() << '\n';
    } catch (...) {
      std::cerr << "[pool] task failed: unknown error\n";
    }
  }
  return results;
}

}  // namespace pacer::core
