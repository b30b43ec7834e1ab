#include "rate/adaptive_rate_controller.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace pacer::rate {

AdaptiveRateController::AdaptiveRateController(AdaptiveRateOptions options)
    : options_(std::move(options)), current_rate_(options_.initial_rate) {
  if (options_.min_rate <= 0) {
    throw std::invalid_argument("min_rate must be greater than 0");
  }
  if (options_.max_rate < options_.min_rate) {
    throw std::invalid_argument("max_rate must be greater than or equal to min_rate");
  }
  if (options_.initial_rate < options_.min_rate || options_.initial_rate > options_.max_rate) {
    throw std::invalid_argument("initial_rate must lie within [min_rate, max_rate]");
  }
  if (!options_.clock) {
    options_.clock = [] { return Clock::now(); };
  }
  window_start_ = options_.clock();
}

SlidingWindowRateLimiter& AdaptiveRateController::limiter(const std::string& host) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = limiters_[host];
  if (slot == nullptr) {
    slot = std::make_unique<SlidingWindowRateLimiter>(static_cast<std::size_t>(current_rate_),
                                                      options_.limiter_window_s, false);
  }
  return *slot;
}

void AdaptiveRateController::report_result(const std::string& /*host*/, const bool success) {
  std::optional<RateChange> change;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (success) {
      ++success_count_;
    } else {
      ++failure_count_;
    }

    const auto now = options_.clock();
    if (now - window_start_ >= options_.window_size) {
      change = roll_window_locked(now);
    }
  }

  if (change.has_value() && options_.on_retune) {
    options_.on_retune(*change);
  }
}

double AdaptiveRateController::wait_if_needed(const std::string& host) {
  return limiter(host).wait_if_needed(host);
}

bool AdaptiveRateController::should_delay(const std::string& host) {
  return !limiter(host).can_make_request(host);
}

void AdaptiveRateController::set_host_rate(const std::string& host, const int rate) {
  if (rate <= 0) {
    throw std::invalid_argument("host rate must be greater than 0");
  }
  limiter(host).set_max_requests(static_cast<std::size_t>(rate));
}

int AdaptiveRateController::current_rate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_rate_;
}

RateControlStats AdaptiveRateController::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RateControlStats stats{};
  stats.current_rate = current_rate_;
  stats.hosts = limiters_.size();
  stats.window_successes = success_count_;
  stats.window_failures = failure_count_;
  stats.adjustments = adjustments_;
  stats.increases = increases_;
  stats.decreases = decreases_;
  return stats;
}

std::optional<RateChange> AdaptiveRateController::roll_window_locked(const Clock::time_point now) {
  const std::uint32_t total = success_count_ + failure_count_;
  const double success_rate = total == 0 ? 1.0 : static_cast<double>(success_count_) / static_cast<double>(total);

  const int previous = current_rate_;
  if (success_rate > 0.9) {
    current_rate_ = std::min(options_.max_rate, static_cast<int>(current_rate_ * 1.1));
  } else if (success_rate < 0.7) {
    current_rate_ = std::max(options_.min_rate, static_cast<int>(current_rate_ * 0.9));
  }

  window_start_ = now;
  success_count_ = 0;
  failure_count_ = 0;
  ++adjustments_;

  for (auto& entry : limiters_) {
    entry.second->set_max_requests(static_cast<std::size_t>(current_rate_));
  }

  if (current_rate_ == previous) {
    return std::nullopt;
  }
  if (current_rate_ > previous) {
    ++increases_;
  } else {
    ++decreases_;
  }
  std::cerr << "[ratectl] success_rate=" << success_rate << " rate " << previous << " -> " << current_rate_
            << " across " << limiters_.size() << " hosts\n";
  return RateChange{previous, current_rate_, success_rate};
}

}  // namespace pacer::rate
