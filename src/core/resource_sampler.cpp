#include "core/resource_sampler.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "core/timestamp.hpp"

namespace pacer::core {

ResourceSampler::ResourceSampler(SamplerOptions options)
    : ResourceSampler(options, std::make_unique<sensors::CpuSensor>(), std::make_unique<sensors::MemorySensor>()) {}

ResourceSampler::ResourceSampler(SamplerOptions options, std::unique_ptr<sensors::CpuSensor> cpu,
                                 std::unique_ptr<sensors::MemorySensor> memory)
    : options_(options), cpu_(std::move(cpu)), memory_(std::move(memory)) {
  if (options_.history_retain == 0 || options_.history_retain > options_.history_capacity) {
    options_.history_retain = options_.history_capacity;
  }
}

ResourceSampler::~ResourceSampler() { stop(); }

void ResourceSampler::set_gauge(GaugeProbe gauge) {
  std::lock_guard<std::mutex> lock(sensor_mutex_);
  gauge_ = std::move(gauge);
}

bool ResourceSampler::sample_once(model::resource_snapshot& out) {
  if (!read_sensors(out, true)) {
    return false;
  }
  record(out);
  return true;
}

void ResourceSampler::start(Listener listener) {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&ResourceSampler::run, this, std::move(listener));
}

void ResourceSampler::stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
  running_.store(false);
}

model::resource_snapshot ResourceSampler::latest() {
  {
    std::lock_guard<std::mutex> lock(history_mutex_);
    if (!history_.empty()) {
      return history_.back();
    }
  }

  model::resource_snapshot snapshot{};
  if (!read_sensors(snapshot, false)) {
    std::cerr << "[sampler] on-demand reading failed; reporting zero load\n";
  }
  return snapshot;
}

std::vector<model::resource_snapshot> ResourceSampler::history() const {
  std::lock_guard<std::mutex> lock(history_mutex_);
  return {history_.begin(), history_.end()};
}

void ResourceSampler::record(const model::resource_snapshot& snapshot) {
  std::lock_guard<std::mutex> lock(history_mutex_);
  history_.push_back(snapshot);
  if (history_.size() > options_.history_capacity) {
    history_.erase(history_.begin(), history_.end() - static_cast<std::ptrdiff_t>(options_.history_retain));
  }
}

void ResourceSampler::run(Listener listener) {
  while (true) {
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
      if (stop_requested_) {
        break;
      }
    }

    try {
      model::resource_snapshot snapshot{};
      if (sample_once(snapshot) && listener) {
        listener(snapshot);
      }
    } catch (const std::exception& ex) {
      ++failures_;
      std::cerr << "[sampler] resource monitor error: " << ex.what() << '\n';
    } catch (...) {
      ++failures_;
      std::cerr << "[sampler] resource monitor error: unknown error\n";
    }

    if (wait_for_stop(options_.interval)) {
      break;
    }
  }
}

bool ResourceSampler::read_sensors(model::resource_snapshot& out, const bool observe_window) {
  out = model::resource_snapshot{};

  float cpu_percent = 0.0F;
  float memory_percent = 0.0F;
  GaugeProbe gauge;
  {
    std::lock_guard<std::mutex> lock(sensor_mutex_);
    gauge = gauge_;
    if (observe_window) {
      cpu_->reset();
      if (!cpu_->sample(cpu_percent)) {
        ++failures_;
        std::cerr << "[sampler] cpu sample failed\n";
        return false;
      }
    }
  }

  if (observe_window && options_.cpu_window.count() > 0 && wait_for_stop(options_.cpu_window)) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(sensor_mutex_);
    // The CPU baseline belongs to the sampling cycle; an on-demand reading
    // has no observation window and reports memory only.
    if (observe_window && !cpu_->sample(cpu_percent)) {
      ++failures_;
      std::cerr << "[sampler] cpu sample failed\n";
      return false;
    }
    if (!memory_->sample(memory_percent)) {
      ++failures_;
      std::cerr << "[sampler] memory sample failed\n";
      return false;
    }
  }

  const LoadGauge load = gauge ? gauge() : LoadGauge{};

  out.cpu_percent = cpu_percent;
  out.memory_percent = memory_percent;
  out.active_worker_count = load.active_worker_count;
  out.pending_queue_depth = load.pending_queue_depth;
  out.timestamp_ns = unix_timestamp_now_ns();
  return true;
}

bool ResourceSampler::wait_for_stop(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return stop_cv_.wait_for(lock, timeout, [this] { return stop_requested_; });
}

}  // namespace pacer::core
