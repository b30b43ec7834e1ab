#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pacer::rate {

// Admits at most max_requests per trailing time_window, either in one shared
// window (global) or in one window per scope key (normally the target host).
class SlidingWindowRateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  static constexpr const char* kDefaultScope = "default";

  explicit SlidingWindowRateLimiter(std::size_t max_requests = 10, double time_window_s = 1.0,
                                    bool global_limit = false);

  SlidingWindowRateLimiter(const SlidingWindowRateLimiter&) = delete;
  SlidingWindowRateLimiter& operator=(const SlidingWindowRateLimiter&) = delete;

  // Pure check; never changes capacity.
  bool can_make_request(const std::string& scope = {});
  void record_request(const std::string& scope = {});

  // Claims the next slot for scope and blocks until it opens. Returns the
  // seconds slept (0 when capacity was available immediately).
  double wait_if_needed(const std::string& scope = {});

  // Timestamps still inside the window after eviction.
  std::size_t in_window(const std::string& scope = {});

  void set_max_requests(std::size_t max_requests);
  [[nodiscard]] std::size_t max_requests() const noexcept { return max_requests_.load(); }
  [[nodiscard]] double time_window() const noexcept;
  [[nodiscard]] bool global_limit() const noexcept { return global_limit_; }
  [[nodiscard]] std::size_t scope_count() const;

 private:
  struct Window {
    std::mutex mutex;
    std::deque<Clock::time_point> stamps;
  };

  Window& window_for(const std::string& scope);
  void evict(Window& window, Clock::time_point now) const;
  static void insert_sorted(Window& window, Clock::time_point stamp);

  std::atomic<std::size_t> max_requests_;
  const Clock::duration time_window_;
  const bool global_limit_;

  mutable std::mutex scopes_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Window>> scopes_;
  Window global_window_;
};

}  // namespace pacer::rate
