#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "model/resource_snapshot.hpp"
#include "sensors/cpu.hpp"
#include "sensors/memory.hpp"

namespace pacer::core {

struct SamplerOptions {
  std::chrono::milliseconds interval{2000};
  std::chrono::milliseconds cpu_window{1000};
  std::size_t history_capacity{100};
  std::size_t history_retain{50};
};

struct LoadGauge {
  std::uint32_t active_worker_count{0};
  std::uint32_t pending_queue_depth{0};
};

class ResourceSampler {
 public:
  using Listener = std::function<void(const model::resource_snapshot&)>;
  using GaugeProbe = std::function<LoadGauge()>;

  explicit ResourceSampler(SamplerOptions options = {});
  ResourceSampler(SamplerOptions options, std::unique_ptr<sensors::CpuSensor> cpu,
                  std::unique_ptr<sensors::MemorySensor> memory);
  ~ResourceSampler();

  ResourceSampler(const ResourceSampler&) = delete;
  ResourceSampler& operator=(const ResourceSampler&) = delete;

  void set_gauge(GaugeProbe gauge);

  // One full cycle: observe CPU over the window, read memory, record.
  // Returns false (and records nothing) when a sensor fails or stop was requested mid-window.
  bool sample_once(model::resource_snapshot& out);

  void start(Listener listener);
  void stop();
  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  // Newest recorded snapshot. Before the first cycle completes, an on-demand
  // reading of memory and load with cpu_percent left at 0.
  [[nodiscard]] model::resource_snapshot latest();
  [[nodiscard]] std::vector<model::resource_snapshot> history() const;
  [[nodiscard]] std::uint32_t sampling_failures() const noexcept { return failures_.load(); }

  // Appends and applies the retention policy; exposed for callers replaying readings.
  void record(const model::resource_snapshot& snapshot);

 private:
  void run(Listener listener);
  bool read_sensors(model::resource_snapshot& out, bool observe_window);
  bool wait_for_stop(std::chrono::milliseconds timeout);

  SamplerOptions options_;
  std::unique_ptr<sensors::CpuSensor> cpu_;
  std::unique_ptr<sensors::MemorySensor> memory_;
  std::mutex sensor_mutex_;

  GaugeProbe gauge_{};
  mutable std::mutex history_mutex_;
  std::deque<model::resource_snapshot> history_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::uint32_t> failures_{0};
  std::thread thread_;
};

}  // namespace pacer::core
