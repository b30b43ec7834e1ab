#include "rate/delay_injector.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace pacer::rate {

DelayInjector::DelayInjector(const double base_delay_s, const double jitter_s, const std::uint32_t seed)
    : base_delay_(base_delay_s), jitter_(jitter_s), rng_(seed) {
  if (base_delay_s < 0.0) {
    throw std::invalid_argument("base delay must not be negative");
  }
  if (jitter_s < 0.0) {
    throw std::invalid_argument("jitter must not be negative");
  }
}

double DelayInjector::get_delay(const std::string& host) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = host_delays_.find(host);
  const double host_base = it != host_delays_.end() ? it->second : base_delay_;

  double offset = 0.0;
  if (jitter_ > 0.0) {
    std::uniform_real_distribution<double> distribution(-jitter_, jitter_);
    offset = distribution(rng_);
  }
  return std::max(0.0, host_base + offset);
}

void DelayInjector::set_host_delay(const std::string& host, const double delay_s) {
  if (delay_s < 0.0) {
    throw std::invalid_argument("host delay must not be negative");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  host_delays_[host] = delay_s;
}

void DelayInjector::clear_host_delay(const std::string& host) {
  std::lock_guard<std::mutex> lock(mutex_);
  host_delays_.erase(host);
}

double DelayInjector::apply_delay(const std::string& host) {
  const double delay = get_delay(host);
  if (delay > 0.0) {
    std::this_thread::sleep_for(std::chrono::duration<double>(delay));
  }
  return delay;
}

}  // namespace pacer::rate
