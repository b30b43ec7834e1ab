#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/engine_event.hpp"
#include "model/engine_frame.hpp"

struct redisContext;

namespace pacer::sinks {

struct RedisSinkOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"pacer:node"};
  std::uint32_t connect_timeout_ms{1000};
  std::size_t stream_maxlen{1000};
  bool publish_health{true};
};

// Mirrors engine state into Redis. The newest frame overwrites the hash
// <prefix>:state; every transition is appended to the capped stream
// <prefix>:events. A failed command drops the connection and the next call
// dials again.
class RedisEventSink {
 public:
  explicit RedisEventSink(RedisSinkOptions options = {});
  ~RedisEventSink();

  RedisEventSink(const RedisEventSink&) = delete;
  RedisEventSink& operator=(const RedisEventSink&) = delete;

  bool connect();
  bool publish_state(const model::engine_frame& frame);
  bool publish_event(const model::engine_event& event);

  [[nodiscard]] bool connected() const noexcept { return context_ != nullptr; }
  [[nodiscard]] std::string endpoint() const;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool execute(const std::vector<std::string>& args);

  RedisSinkOptions options_;
  std::string state_key_;
  std::string events_key_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
};

}  // namespace pacer::sinks
