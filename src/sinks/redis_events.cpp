#include "sinks/redis_events.hpp"

#include <cstdio>
#include <iostream>
#include <utility>

#include <hiredis/hiredis.h>

namespace pacer::sinks {
namespace {

std::string format_fixed(const double value, const int precision) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
  return buffer;
}

void add_field(std::vector<std::string>& args, const char* name, std::string value) {
  args.emplace_back(name);
  args.push_back(std::move(value));
}

}  // namespace

void RedisEventSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

RedisEventSink::RedisEventSink(RedisSinkOptions options)
    : options_(std::move(options)),
      state_key_(options_.key_prefix + ":state"),
      events_key_(options_.key_prefix + ":events") {}

RedisEventSink::~RedisEventSink() = default;

std::string RedisEventSink::endpoint() const {
  if (!options_.unix_socket.empty()) {
    return "unix://" + options_.unix_socket;
  }
  return options_.host + ':' + std::to_string(options_.port);
}

bool RedisEventSink::connect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  std::unique_ptr<redisContext, ContextDeleter> context(
      options_.unix_socket.empty()
          ? redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout)
          : redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout));
  if (context == nullptr) {
    std::cerr << "[redis] connect to " << endpoint() << " failed: out of memory\n";
    return false;
  }
  if (context->err != REDIS_OK) {
    std::cerr << "[redis] connect to " << endpoint() << " failed: " << context->errstr << '\n';
    return false;
  }

  context_ = std::move(context);
  return true;
}

bool RedisEventSink::publish_state(const model::engine_frame& frame) {
  std::vector<std::string> args{"HSET", state_key_};
  args.reserve(2 + 2 * 14);
  add_field(args, "timestamp_ns", std::to_string(frame.timestamp));
  add_field(args, "cpu_pct", format_fixed(frame.cpu, 2));
  add_field(args, "memory_pct", format_fixed(frame.memory, 2));
  add_field(args, "workers", std::to_string(frame.workers));
  add_field(args, "active", std::to_string(frame.active));
  add_field(args, "pending", std::to_string(frame.pending));
  add_field(args, "rate", std::to_string(frame.current_rate));
  add_field(args, "hosts", std::to_string(frame.hosts));
  add_field(args, "window_successes", std::to_string(frame.window_successes));
  add_field(args, "window_failures", std::to_string(frame.window_failures));
  add_field(args, "rate_adjustments", std::to_string(frame.rate_adjustments));
  if (options_.publish_health) {
    add_field(args, "heartbeat_ms", std::to_string(frame.agent.heartbeat_ms));
    add_field(args, "redis_errors", std::to_string(frame.agent.redis_errors));
    add_field(args, "sampler_failures", std::to_string(frame.agent.sampler_failures));
  }
  return execute(args);
}

bool RedisEventSink::publish_event(const model::engine_event& event) {
  std::vector<std::string> args{"XADD", events_key_, "MAXLEN", "~", std::to_string(options_.stream_maxlen), "*"};
  add_field(args, "kind", model::to_string(event.kind));
  add_field(args, "timestamp_ms", std::to_string(event.timestamp_ms));
  add_field(args, "from", std::to_string(event.from));
  add_field(args, "to", std::to_string(event.to));
  if (event.kind == model::engine_event::Kind::pool_resized) {
    add_field(args, "cpu_pct", format_fixed(event.cpu, 2));
    add_field(args, "memory_pct", format_fixed(event.memory, 2));
  } else {
    add_field(args, "success_rate", format_fixed(event.success_rate, 3));
  }
  return execute(args);
}

bool RedisEventSink::execute(const std::vector<std::string>& args) {
  if (context_ == nullptr && !connect()) {
    return false;
  }

  std::vector<const char*> argv;
  std::vector<std::size_t> lengths;
  argv.reserve(args.size());
  lengths.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    lengths.push_back(arg.size());
  }

  auto* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), lengths.data()));
  if (reply == nullptr) {
    // The context is unusable after an I/O or protocol error.
    context_.reset();
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

}  // namespace pacer::sinks
