#include <chrono>
#include <csignal>
#include <cstddef>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "core/engine.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const pacer::core::EngineConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | workers=" << config.pool.min_workers << ".." << config.pool.max_workers
         << " | cpu_threshold=" << config.pool.cpu_threshold
         << " | memory_threshold=" << config.pool.memory_threshold
         << " | sampler=" << (config.sampler.enabled ? "on" : "off")
         << " | rate=" << config.rate.initial_rate << " [" << config.rate.min_rate << ',' << config.rate.max_rate << ']'
         << " | delay_s=" << config.delay.base_s << "+-" << config.delay.jitter_s
         << " | retries=" << config.retry.max_retries
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

// Paces a wave of placeholder probes against one host. The probe body is
// where a real scanner issues its request.
void dispatch_probes(pacer::core::Engine& engine, const std::string& host) {
  const int probe_count = engine.optimal_thread_count();

  std::vector<std::function<bool()>> probes;
  probes.reserve(static_cast<std::size_t>(probe_count));
  for (int i = 0; i < probe_count; ++i) {
    probes.emplace_back([&engine, host]() {
      engine.wait_before_request(host);
      engine.report_request_result(host, true);
      return true;
    });
  }

  const auto started = std::chrono::steady_clock::now();
  const auto results = engine.scheduler().schedule_batch(probes);
  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();

  std::size_t completed = 0;
  for (const auto& result : results) {
    if (result.has_value()) {
      ++completed;
    }
  }
  std::cerr << "[agent] " << host << ": " << completed << '/' << results.size() << " probes paced in "
            << elapsed_ms << " ms\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/pacer.default.yaml";

  pacer::core::EngineConfig config{};
  try {
    config = pacer::core::load_engine_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  pacer::core::Engine engine{config};
  for (int i = 2; i < argc && g_shutdown_requested == 0; ++i) {
    dispatch_probes(engine, argv[i]);
  }

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cerr << "[agent] shutdown signal received; exiting cleanly\n";
  engine.shutdown(true);

  return 0;
}
