#include "rate/rate_limiter.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "core/timestamp.hpp"

namespace pacer::rate {

SlidingWindowRateLimiter::SlidingWindowRateLimiter(const std::size_t max_requests, const double time_window_s,
                                                   const bool global_limit)
    : max_requests_(max_requests), time_window_(core::from_seconds(time_window_s)), global_limit_(global_limit) {
  if (max_requests == 0) {
    throw std::invalid_argument("max_requests must be greater than 0");
  }
  if (!(time_window_s > 0.0)) {
    throw std::invalid_argument("time_window must be greater than 0");
  }
}

bool SlidingWindowRateLimiter::can_make_request(const std::string& scope) {
  Window& window = window_for(scope);
  std::lock_guard<std::mutex> lock(window.mutex);
  evict(window, Clock::now());
  return window.stamps.size() < max_requests_.load();
}

void SlidingWindowRateLimiter::record_request(const std::string& scope) {
  Window& window = window_for(scope);
  std::lock_guard<std::mutex> lock(window.mutex);
  insert_sorted(window, Clock::now());
}

double SlidingWindowRateLimiter::wait_if_needed(const std::string& scope) {
  Window& window = window_for(scope);

  Clock::duration wait{0};
  {
    std::lock_guard<std::mutex> lock(window.mutex);
    const auto now = Clock::now();
    evict(window, now);

    const std::size_t limit = max_requests_.load();
    const std::size_t count = window.stamps.size();
    if (count < limit) {
      insert_sorted(window, now);
      return 0.0;
    }

    // The new request may only land once the entry limit places before it
    // has left the window. With no outstanding reservations that entry is
    // the oldest one.
    const auto opens_at = window.stamps[count - limit] + time_window_;
    wait = std::max(Clock::duration::zero(), opens_at - now);
    insert_sorted(window, now + wait);
  }

  if (wait > Clock::duration::zero()) {
    std::this_thread::sleep_for(wait);
  }
  return core::to_seconds(wait);
}

std::size_t SlidingWindowRateLimiter::in_window(const std::string& scope) {
  Window& window = window_for(scope);
  std::lock_guard<std::mutex> lock(window.mutex);
  evict(window, Clock::now());
  return window.stamps.size();
}

void SlidingWindowRateLimiter::set_max_requests(const std::size_t max_requests) {
  if (max_requests == 0) {
    throw std::invalid_argument("max_requests must be greater than 0");
  }
  max_requests_.store(max_requests);
}

double SlidingWindowRateLimiter::time_window() const noexcept { return core::to_seconds(time_window_); }

std::size_t SlidingWindowRateLimiter::scope_count() const {
  if (global_limit_) {
    return 1;
  }
  std::lock_guard<std::mutex> lock(scopes_mutex_);
  return scopes_.size();
}

SlidingWindowRateLimiter::Window& SlidingWindowRateLimiter::window_for(const std::string& scope) {
  if (global_limit_) {
    return global_window_;
  }

  const std::string& key = scope.empty() ? std::string(kDefaultScope) : scope;
  std::lock_guard<std::mutex> lock(scopes_mutex_);
  auto& slot = scopes_[key];
  if (slot == nullptr) {
    slot = std::make_unique<Window>();
  }
  return *slot;
}

void SlidingWindowRateLimiter::evict(Window& window, const Clock::time_point now) const {
  const auto cutoff = now - time_window_;
  while (!window.stamps.empty() && window.stamps.front() <= cutoff) {
    window.stamps.pop_front();
  }
}

void SlidingWindowRateLimiter::insert_sorted(Window& window, const Clock::time_point stamp) {
  if (window.stamps.empty() || window.stamps.back() <= stamp) {
    window.stamps.push_back(stamp);
    return;
  }
  window.stamps.insert(std::upper_bound(window.stamps.begin(), window.stamps.end(), stamp), stamp);
}

}  // namespace pacer::rate
