#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pacer::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"pacer:node"};
  std::size_t stream_maxlen{1000};
  bool enabled{false};
};

struct PoolConfig {
  std::size_t min_workers{2};
  std::size_t max_workers{15};
  float cpu_threshold{85.0F};
  float memory_threshold{85.0F};
};

struct SamplerConfig {
  bool enabled{true};
  std::chrono::milliseconds interval{2000};
  std::chrono::milliseconds cpu_window{1000};
};

struct RateConfig {
  int initial_rate{10};
  int min_rate{1};
  int max_rate{50};
  double window_s{10.0};
  double limiter_window_s{1.0};
};

struct DelayConfig {
  double base_s{0.1};
  double jitter_s{0.05};
};

struct RetryConfig {
  unsigned max_retries{3};
  double backoff_factor{1.0};
};

struct EngineConfig {
  PoolConfig pool{};
  SamplerConfig sampler{};
  RateConfig rate{};
  DelayConfig delay{};
  RetryConfig retry{};
  int thread_base_count{10};
  bool publish_health{true};
  bool stdout_debug{false};
  RedisConfig redis{};
};

EngineConfig load_engine_config(const std::string& path);

// Cross-field checks shared by the loader and callers building configs in code.
void validate_engine_config(const EngineConfig& config);

}  // namespace pacer::core
