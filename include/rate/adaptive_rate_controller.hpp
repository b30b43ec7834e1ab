#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "rate/rate_limiter.hpp"

namespace pacer::rate {

struct RateChange {
  int previous;
  int current;
  double success_rate;
};

struct AdaptiveRateOptions {
  int initial_rate{10};
  int min_rate{1};
  int max_rate{50};
  std::chrono::duration<double> window_size{10.0};
  double limiter_window_s{1.0};
  std::function<std::chrono::steady_clock::time_point()> clock{};
  // Called after a rollover changed the rate, outside the controller lock,
  // on the thread whose report closed the window.
  std::function<void(const RateChange&)> on_retune{};
};

struct RateControlStats {
  int current_rate{0};
  std::size_t hosts{0};
  std::uint32_t window_successes{0};
  std::uint32_t window_failures{0};
  std::uint64_t adjustments{0};
  std::uint64_t increases{0};
  std::uint64_t decreases{0};
};

// Owns one SlidingWindowRateLimiter per host and retunes them from the
// success ratio observed over rolling windows.
//
// The success/failure counters are shared by all hosts, and every rollover
// pushes the same rate to every limiter: one failing host lowers the budget
// of all the others.
class AdaptiveRateController {
 public:
  using Clock = std::chrono::steady_clock;

  explicit AdaptiveRateController(AdaptiveRateOptions options = {});

  AdaptiveRateController(const AdaptiveRateController&) = delete;
  AdaptiveRateController& operator=(const AdaptiveRateController&) = delete;

  // Get-or-insert; a new limiter starts at the current rate.
  SlidingWindowRateLimiter& limiter(const std::string& host);

  void report_result(const std::string& host, bool success);
  double wait_if_needed(const std::string& host);
  bool should_delay(const std::string& host);

  // Overrides one host's budget until the next rollover retunes all hosts.
  void set_host_rate(const std::string& host, int rate);

  [[nodiscard]] int current_rate() const;
  [[nodiscard]] RateControlStats stats() const;

 private:
  std::optional<RateChange> roll_window_locked(Clock::time_point now);

  AdaptiveRateOptions options_;
  mutable std::mutex mutex_;
  int current_rate_;
  std::uint32_t success_count_{0};
  std::uint32_t failure_count_{0};
  Clock::time_point window_start_;
  std::uint64_t adjustments_{0};
  std::uint64_t increases_{0};
  std::uint64_t decreases_{0};
  std::unordered_map<std::string, std::unique_ptr<SlidingWindowRateLimiter>> limiters_;
};

}  // namespace pacer::rate
