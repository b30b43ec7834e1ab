#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "core/config.hpp"
#include "core/task_scheduler.hpp"
#include "core/worker_pool.hpp"
#include "model/engine_event.hpp"
#include "model/engine_frame.hpp"
#include "model/resource_snapshot.hpp"
#include "rate/adaptive_rate_controller.hpp"
#include "rate/delay_injector.hpp"
#include "sinks/redis_events.hpp"
#include "sinks/stdout_debug.hpp"

namespace pacer::core {

// Process context for one probing run: the pool and its sampler, the retry
// and batch scheduler, per-host rate control and the delay injector. Build
// one at startup and hand references to whatever needs them.
class Engine {
 public:
  explicit Engine(EngineConfig config = {});
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  AdaptiveWorkerPool& pool() noexcept { return *pool_; }
  TaskScheduler& scheduler() noexcept { return *scheduler_; }
  rate::AdaptiveRateController& rate_control() noexcept { return rate_control_; }
  rate::DelayInjector& delays() noexcept { return delays_; }
  [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

  // Runs work with the configured retry budget; rethrows the final failure.
  template <typename F>
  auto submit_task(F work) {
    return scheduler_->schedule_with_backoff(std::move(work), config_.retry.max_retries, config_.retry.backoff_factor);
  }

  // Delay first, then the host's rate window. Returns the rate-limiter wait in seconds.
  double wait_before_request(const std::string& host);
  void report_request_result(const std::string& host, bool success);
  void set_host_rate_limit(const std::string& host, int rate);
  bool should_delay_request(const std::string& host);

  [[nodiscard]] model::resource_snapshot current_snapshot();
  [[nodiscard]] std::size_t worker_count() const;
  [[nodiscard]] int optimal_thread_count(int base_count);
  [[nodiscard]] int optimal_thread_count() { return optimal_thread_count(config_.thread_base_count); }

  // Last frame handed to the sinks.
  [[nodiscard]] model::engine_frame last_frame() const;

  // Stops sampling and drains (wait) or abandons (!wait) queued work. Idempotent.
  void shutdown(bool wait = true);

 private:
  void publish(const model::resource_snapshot& snapshot, std::size_t current_workers);
  void emit(const model::engine_event& event);
  void record_redis_result(bool ok);

  EngineConfig config_;
  rate::DelayInjector delays_;
  rate::AdaptiveRateController rate_control_;

  // Guards both sinks and the redis error bookkeeping; events arrive from
  // request threads while frames arrive from the sampler.
  std::mutex sink_mutex_;
  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisEventSink> redis_sink_{};
  bool redis_was_ok_{true};
  std::uint32_t redis_errors_{0};

  mutable std::mutex frame_mutex_;
  model::engine_frame frame_{};

  const ResourceSampler* sampler_{nullptr};
  std::unique_ptr<AdaptiveWorkerPool> pool_;
  std::unique_ptr<TaskScheduler> scheduler_;
  bool shut_down_{false};
};

}  // namespace pacer::core
