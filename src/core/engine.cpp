#include "core/engine.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <utility>

#include "core/thread_budget.hpp"
#include "core/timestamp.hpp"

namespace pacer::core {
namespace {

rate::AdaptiveRateOptions make_rate_options(const RateConfig& config,
                                            std::function<void(const rate::RateChange&)> on_retune) {
  rate::AdaptiveRateOptions options{};
  options.initial_rate = config.initial_rate;
  options.min_rate = config.min_rate;
  options.max_rate = config.max_rate;
  options.window_size = std::chrono::duration<double>(config.window_s);
  options.limiter_window_s = config.limiter_window_s;
  options.on_retune = std::move(on_retune);
  return options;
}

EngineConfig validated(EngineConfig config) {
  validate_engine_config(config);
  return config;
}

PoolOptions make_pool_options(const PoolConfig& config) {
  PoolOptions options{};
  options.min_workers = config.min_workers;
  options.max_workers = config.max_workers;
  options.cpu_threshold = config.cpu_threshold;
  options.memory_threshold = config.memory_threshold;
  return options;
}

}  // namespace

Engine::Engine(EngineConfig config)
    : config_(validated(std::move(config))),
      delays_(config_.delay.base_s, config_.delay.jitter_s),
      rate_control_(make_rate_options(config_.rate, [this](const rate::RateChange& change) {
        model::engine_event event{};
        event.kind = model::engine_event::Kind::rate_retuned;
        event.timestamp_ms = unix_timestamp_now_ns() / 1'000'000ULL;
        event.from = change.previous;
        event.to = change.current;
        event.success_rate = change.success_rate;
        emit(event);
      })) {
  frame_.workers = static_cast<std::uint32_t>(config_.pool.min_workers);

  if (config_.redis.enabled) {
    sinks::RedisSinkOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.key_prefix = config_.redis.key_prefix;
    options.stream_maxlen = config_.redis.stream_maxlen;
    options.publish_health = config_.publish_health;
    redis_sink_ = std::make_unique<sinks::RedisEventSink>(options);

    const bool reachable = redis_sink_->connect();
    std::cerr << "[engine] redis connectivity " << (reachable ? "confirmed" : "check failed") << " at "
              << redis_sink_->endpoint() << '\n';
  }

  std::unique_ptr<ResourceSampler> sampler;
  if (config_.sampler.enabled) {
    SamplerOptions sampler_options{};
    sampler_options.interval = config_.sampler.interval;
    sampler_options.cpu_window = config_.sampler.cpu_window;
    sampler = std::make_unique<ResourceSampler>(sampler_options);
    sampler_ = sampler.get();
  } else {
    std::cerr << "[engine] resource sampling disabled; worker count stays at " << config_.pool.min_workers << '\n';
  }

  pool_ = std::make_unique<AdaptiveWorkerPool>(make_pool_options(config_.pool), std::move(sampler),
                                               [this](const model::resource_snapshot& snapshot, const std::size_t current_workers) {
                                                 publish(snapshot, current_workers);
                                               });
  scheduler_ = std::make_unique<TaskScheduler>(
      *pool_, RetryPolicy{config_.retry.max_retries, config_.retry.backoff_factor});
}

Engine::~Engine() { shutdown(true); }

double Engine::wait_before_request(const std::string& host) {
  delays_.apply_delay(host);
  return rate_control_.wait_if_needed(host);
}

void Engine::report_request_result(const std::string& host, const bool success) {
  rate_control_.report_result(host, success);
}

void Engine::set_host_rate_limit(const std::string& host, const int rate) {
  rate_control_.set_host_rate(host, rate);
}

bool Engine::should_delay_request(const std::string& host) {
  return rate_control_.should_delay(host);
}

model::resource_snapshot Engine::current_snapshot() {
  return pool_->current_snapshot();
}

std::size_t Engine::worker_count() const {
  return pool_->current_worker_count();
}

int Engine::optimal_thread_count(const int base_count) {
  return core::optimal_thread_count(base_count, current_snapshot());
}

model::engine_frame Engine::last_frame() const {
  std::lock_guard<std::mutex> lock(frame_mutex_);
  return frame_;
}

void Engine::shutdown(const bool wait) {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;

  if (pool_ != nullptr) {
    pool_->shutdown(wait);
  }
  std::cerr << "[engine] shut down (" << (wait ? "drained" : "abandoned") << " outstanding work)\n";
}

void Engine::publish(const model::resource_snapshot& snapshot, const std::size_t current_workers) {
  const auto rates = rate_control_.stats();

  model::engine_frame frame{};
  {
    std::lock_guard<std::mutex> lock(frame_mutex_);
    frame = frame_;
  }
  const std::uint32_t previous_workers = frame.workers;

  frame.timestamp = snapshot.timestamp_ns;
  frame.cpu = snapshot.cpu_percent;
  frame.memory = snapshot.memory_percent;
  frame.workers = static_cast<std::uint32_t>(current_workers);
  frame.active = snapshot.active_worker_count;
  frame.pending = snapshot.pending_queue_depth;
  frame.current_rate = static_cast<std::uint32_t>(rates.current_rate);
  frame.hosts = static_cast<std::uint32_t>(rates.hosts);
  frame.window_successes = rates.window_successes;
  frame.window_failures = rates.window_failures;
  frame.rate_adjustments = static_cast<std::uint32_t>(rates.adjustments);
  frame.agent.heartbeat_ms = unix_timestamp_now_ns() / 1'000'000ULL;
  frame.agent.sampler_failures = sampler_ != nullptr ? sampler_->sampling_failures() : 0;

  if (frame.workers != previous_workers) {
    model::engine_event event{};
    event.kind = model::engine_event::Kind::pool_resized;
    event.timestamp_ms = frame.agent.heartbeat_ms;
    event.from = previous_workers;
    event.to = frame.workers;
    event.cpu = frame.cpu;
    event.memory = frame.memory;
    emit(event);
  }

  {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (config_.stdout_debug) {
      stdout_sink_.publish(frame);
    }
    if (redis_sink_ != nullptr) {
      const bool ok = redis_sink_->publish_state(frame);
      record_redis_result(ok);
    }
    frame.agent.redis_errors = redis_errors_;
  }

  std::lock_guard<std::mutex> lock(frame_mutex_);
  frame_ = frame;
}

void Engine::emit(const model::engine_event& event) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  if (config_.stdout_debug) {
    stdout_sink_.publish(event);
  }
  if (redis_sink_ != nullptr) {
    record_redis_result(redis_sink_->publish_event(event));
  }
}

void Engine::record_redis_result(const bool ok) {
  if (!ok) {
    ++redis_errors_;
    if (redis_was_ok_) {
      std::cerr << "[redis] publish to " << redis_sink_->endpoint() << " failed\n";
      redis_was_ok_ = false;
    }
  } else if (!redis_was_ok_) {
    std::cerr << "[redis] publish recovered\n";
    redis_was_ok_ = true;
  }
}

}  // namespace pacer::core
