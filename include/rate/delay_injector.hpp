#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

namespace pacer::rate {

// Jittered pre-request pause, independent of the rate limiters. The effective
// delay is the host override (or base_delay) plus uniform(-jitter, jitter),
// clamped at zero.
class DelayInjector {
 public:
  DelayInjector(double base_delay_s = 0.0, double jitter_s = 0.1, std::uint32_t seed = std::random_device{}());

  DelayInjector(const DelayInjector&) = delete;
  DelayInjector& operator=(const DelayInjector&) = delete;

  double get_delay(const std::string& host);
  void set_host_delay(const std::string& host, double delay_s);
  void clear_host_delay(const std::string& host);

  // Sleeps get_delay(host) when positive; returns the seconds slept.
  double apply_delay(const std::string& host);

  [[nodiscard]] double base_delay() const noexcept { return base_delay_; }
  [[nodiscard]] double jitter() const noexcept { return jitter_; }

 private:
  const double base_delay_;
  const double jitter_;
  std::mutex mutex_;
  std::mt19937 rng_;
  std::unordered_map<std::string, double> host_delays_;
};

}  // namespace pacer::rate
