#include "core/worker_pool.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace pacer::core {

AdaptiveWorkerPool::AdaptiveWorkerPool(PoolOptions options, std::unique_ptr<ResourceSampler> sampler,
                                       SnapshotObserver observer)
    : options_(options),
      current_workers_(options.min_workers),
      sampler_(std::move(sampler)),
      observer_(std::move(observer)) {
  if (options_.min_workers == 0) {
    throw std::invalid_argument("min_workers must be greater than 0");
  }
  if (options_.max_workers < options_.min_workers) {
    throw std::invalid_argument("max_workers (" + std::to_string(options_.max_workers) +
                                ") must be greater than or equal to min_workers (" +
                                std::to_string(options_.min_workers) + ")");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    rebuild_locked();
  }

  if (sampler_ != nullptr) {
    sampler_->set_gauge([this]() { return load(); });
    sampler_->start([this](const model::resource_snapshot& snapshot) { on_snapshot(snapshot); });
  }
}

AdaptiveWorkerPool::~AdaptiveWorkerPool() {
  shutdown(true);
}

void AdaptiveWorkerPool::post(Executor::Job job) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_.load() || executor_ == nullptr || !executor_->post(std::move(job))) {
    throw std::runtime_error("worker pool is shut down");
  }
}

bool AdaptiveWorkerPool::adjust_workers(const float cpu_percent, const float memory_percent) {
  const std::size_t pending = pending_queue_depth();

  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_.load()) {
    return false;
  }

  if (cpu_percent > options_.cpu_threshold || memory_percent > options_.memory_threshold) {
    if (current_workers_ > options_.min_workers) {
      current_workers_ = current_workers_ > options_.min_workers + 2 ? current_workers_ - 2 : options_.min_workers;
      std::cerr << "[pool] reducing workers to " << current_workers_ << " due to high resource usage (cpu="
                << cpu_percent << " memory=" << memory_percent << ")\n";
      rebuild_locked();
      return true;
    }
    return false;
  }

  if (cpu_percent < options_.cpu_threshold * 0.6F && memory_percent < options_.memory_threshold * 0.6F &&
      pending > current_workers_) {
    if (current_workers_ < options_.max_workers) {
      current_workers_ = std::min(options_.max_workers, current_workers_ + 2);
      std::cerr << "[pool] increasing workers to " << current_workers_ << " due to low resource usage (pending="
                << pending << ")\n";
      rebuild_locked();
      return true;
    }
  }
  return false;
}

std::size_t AdaptiveWorkerPool::current_worker_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_workers_;
}

PoolState AdaptiveWorkerPool::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return PoolState{options_.min_workers, options_.max_workers, current_workers_,
                   options_.cpu_threshold, options_.memory_threshold, generation_};
}

std::size_t AdaptiveWorkerPool::pending_queue_depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t pending = executor_ != nullptr ? executor_->pending() : 0;
  for (const auto& retired : retired_) {
    pending += retired->pending();
  }
  return pending;
}

std::size_t AdaptiveWorkerPool::active_worker_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t active = executor_ != nullptr ? executor_->busy() : 0;
  for (const auto& retired : retired_) {
    active += retired->busy();
  }
  return active;
}

LoadGauge AdaptiveWorkerPool::load() const {
  return LoadGauge{static_cast<std::uint32_t>(active_worker_count()),
                   static_cast<std::uint32_t>(pending_queue_depth())};
}

model::resource_snapshot AdaptiveWorkerPool::current_snapshot() {
  if (sampler_ != nullptr) {
    return sampler_->latest();
  }

  model::resource_snapshot snapshot{};
  const LoadGauge gauge = load();
  snapshot.active_worker_count = gauge.active_worker_count;
  snapshot.pending_queue_depth = gauge.pending_queue_depth;
  return snapshot;
}

void AdaptiveWorkerPool::shutdown(const bool wait) {
  if (sampler_ != nullptr) {
    sampler_->stop();
  }

  std::vector<std::shared_ptr<Executor>> executors;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shut_down_.store(true);
    if (executor_ != nullptr) {
      executors.push_back(executor_);
    }
    executors.insert(executors.end(), retired_.begin(), retired_.end());
  }

  for (const auto& executor : executors) {
    if (!wait) {
      const std::size_t dropped = executor->discard_pending();
      if (dropped > 0) {
        std::cerr << "[pool] discarded " << dropped << " queued tasks on shutdown\n";
      }
    }
    executor->request_stop();
  }

  if (wait) {
    for (const auto& executor : executors) {
      executor->join();
    }
  }
}

void AdaptiveWorkerPool::rebuild_locked() {
  if (executor_ != nullptr) {
    executor_->request_stop();
    retired_.push_back(std::move(executor_));
  }
  reap_retired_locked();

  ++generation_;
  executor_ = std::make_shared<Executor>(current_workers_);
}

void AdaptiveWorkerPool::reap_retired_locked() {
  retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                [](const std::shared_ptr<Executor>& retired) {
                                  if (!retired->finished()) {
                                    return false;
                                  }
                                  retired->join();
                                  return true;
                                }),
                 retired_.end());
}

void AdaptiveWorkerPool::on_snapshot(const model::resource_snapshot& snapshot) {
  adjust_workers(snapshot.cpu_percent, snapshot.memory_percent);
  if (observer_) {
    observer_(snapshot, current_worker_count());
  }
}

}  // namespace pacer::core
