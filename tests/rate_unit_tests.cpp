#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/thread_budget.hpp"
#include "model/resource_snapshot.hpp"
#include "rate/adaptive_rate_controller.hpp"
#include "rate/delay_injector.hpp"
#include "rate/rate_limiter.hpp"

using pacer::core::optimal_thread_count;
using pacer::model::resource_snapshot;
using pacer::rate::AdaptiveRateController;
using pacer::rate::AdaptiveRateOptions;
using pacer::rate::DelayInjector;
using pacer::rate::SlidingWindowRateLimiter;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

// Manually advanced clock for window rollover tests.
struct FakeClock {
  std::shared_ptr<std::chrono::steady_clock::time_point> now =
      std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());

  void advance(double seconds) const {
    *now += std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<double>(seconds));
  }

  AdaptiveRateOptions options(int initial_rate) const {
    AdaptiveRateOptions options{};
    options.initial_rate = initial_rate;
    options.window_size = std::chrono::duration<double>(10.0);
    auto shared = now;
    options.clock = [shared] { return *shared; };
    return options;
  }
};

void report_many(AdaptiveRateController& controller, const std::string& host, int successes, int failures) {
  for (int i = 0; i < successes; ++i) {
    controller.report_result(host, true);
  }
  for (int i = 0; i < failures; ++i) {
    controller.report_result(host, false);
  }
}

int test_limiter_blocks_fourth_request() {
  SlidingWindowRateLimiter limiter(3, 1.0);

  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 3; ++i) {
    if (limiter.wait_if_needed("api.example.com") != 0.0) {
      return fail("test_limiter_blocks_fourth_request", "first three requests must pass immediately");
    }
  }
  if (limiter.can_make_request("api.example.com")) {
    return fail("test_limiter_blocks_fourth_request", "window should be full after three requests");
  }

  const double waited = limiter.wait_if_needed("api.example.com");
  const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  if (waited < 0.8 || waited > 1.0) {
    return fail("test_limiter_blocks_fourth_request", "fourth request should wait about one window");
  }
  if (elapsed < 0.95) {
    return fail("test_limiter_blocks_fourth_request", "fourth request returned before its slot opened");
  }
  return 0;
}

int test_check_is_idempotent() {
  SlidingWindowRateLimiter limiter(2, 1.0);
  for (int i = 0; i < 10; ++i) {
    if (!limiter.can_make_request("a")) {
      return fail("test_check_is_idempotent", "checking capacity must not consume it");
    }
  }
  if (limiter.in_window("a") != 0) {
    return fail("test_check_is_idempotent", "no request was recorded");
  }
  limiter.record_request("a");
  limiter.record_request("a");
  if (limiter.can_make_request("a") || limiter.in_window("a") != 2) {
    return fail("test_check_is_idempotent", "two recorded requests should fill the window");
  }
  return 0;
}

int test_scopes_are_isolated() {
  SlidingWindowRateLimiter limiter(1, 5.0);
  limiter.record_request("alpha");

  if (limiter.can_make_request("alpha")) {
    return fail("test_scopes_are_isolated", "alpha should be exhausted");
  }
  if (!limiter.can_make_request("beta")) {
    return fail("test_scopes_are_isolated", "beta must not share alpha's window");
  }

  limiter.record_request();
  if (limiter.can_make_request(SlidingWindowRateLimiter::kDefaultScope)) {
    return fail("test_scopes_are_isolated", "empty scope should map to the default scope");
  }
  if (limiter.scope_count() != 3) {
    return fail("test_scopes_are_isolated", "expected alpha, beta and default scopes");
  }
  return 0;
}

int test_global_mode_shares_one_window() {
  SlidingWindowRateLimiter limiter(2, 5.0, true);
  limiter.record_request("alpha");
  limiter.record_request("beta");

  if (limiter.can_make_request("gamma")) {
    return fail("test_global_mode_shares_one_window", "global limiter must count every scope together");
  }
  if (limiter.scope_count() != 1 || !limiter.global_limit()) {
    return fail("test_global_mode_shares_one_window", "global limiter keeps a single window");
  }
  return 0;
}

int test_entries_expire_after_window() {
  SlidingWindowRateLimiter limiter(2, 0.05);
  limiter.record_request("h");
  limiter.record_request("h");
  if (limiter.can_make_request("h")) {
    return fail("test_entries_expire_after_window", "window should be full");
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(70));
  if (!limiter.can_make_request("h") || limiter.in_window("h") != 0) {
    return fail("test_entries_expire_after_window", "old entries must be evicted");
  }
  return 0;
}

int test_concurrent_waits_never_overadmit() {
  SlidingWindowRateLimiter limiter(5, 0.3);
  std::atomic<int> immediate{0};
  std::vector<std::thread> callers;
  for (int i = 0; i < 10; ++i) {
    callers.emplace_back([&limiter, &immediate]() {
      if (limiter.wait_if_needed("shared") == 0.0) {
        ++immediate;
      }
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }

  if (immediate.load() != 5) {
    return fail("test_concurrent_waits_never_overadmit", "exactly max_requests callers may pass without waiting");
  }
  return 0;
}

int test_invalid_limiter_arguments() {
  int rejected = 0;
  try {
    SlidingWindowRateLimiter limiter(0, 1.0);
  } catch (const std::invalid_argument&) {
    ++rejected;
  }
  try {
    SlidingWindowRateLimiter limiter(5, 0.0);
  } catch (const std::invalid_argument&) {
    ++rejected;
  }
  try {
    SlidingWindowRateLimiter limiter(5, 1.0);
    limiter.set_max_requests(0);
  } catch (const std::invalid_argument&) {
    ++rejected;
  }
  if (rejected != 3) {
    return fail("test_invalid_limiter_arguments", "zero capacity and empty windows must be rejected");
  }
  return 0;
}

int test_rate_increases_on_high_success() {
  FakeClock clock;
  AdaptiveRateController controller(clock.options(10));

  report_many(controller, "h", 95, 4);
  if (controller.current_rate() != 10) {
    return fail("test_rate_increases_on_high_success", "rate must not move inside the window");
  }
  clock.advance(10.0);
  controller.report_result("h", false);

  const auto stats = controller.stats();
  if (stats.current_rate != 11 || stats.adjustments != 1 || stats.increases != 1) {
    return fail("test_rate_increases_on_high_success", "95% success should raise 10 to 11");
  }
  if (stats.window_successes != 0 || stats.window_failures != 0) {
    return fail("test_rate_increases_on_high_success", "rollover must reset the counters");
  }
  return 0;
}

int test_rate_decreases_on_low_success() {
  FakeClock clock;
  AdaptiveRateController controller(clock.options(10));

  report_many(controller, "h", 5, 14);
  clock.advance(10.0);
  controller.report_result("h", false);

  if (controller.current_rate() != 9 || controller.stats().decreases != 1) {
    return fail("test_rate_decreases_on_low_success", "25% success should lower 10 to 9");
  }

  // Mid band (between 0.7 and 0.9) leaves the rate alone.
  report_many(controller, "h", 8, 1);
  clock.advance(10.0);
  controller.report_result("h", false);
  if (controller.current_rate() != 9 || controller.stats().adjustments != 2) {
    return fail("test_rate_decreases_on_low_success", "80% success must keep the rate");
  }
  return 0;
}

int test_rate_stays_within_bounds() {
  FakeClock clock;
  AdaptiveRateOptions floor_options = clock.options(1);
  AdaptiveRateController floor(floor_options);
  for (int round = 0; round < 3; ++round) {
    report_many(floor, "h", 0, 5);
    clock.advance(10.0);
    floor.report_result("h", false);
  }
  if (floor.current_rate() != 1) {
    return fail("test_rate_stays_within_bounds", "rate must never drop below min_rate");
  }

  AdaptiveRateController ceiling(clock.options(50));
  for (int round = 0; round < 3; ++round) {
    report_many(ceiling, "h", 20, 0);
    clock.advance(10.0);
    ceiling.report_result("h", true);
  }
  if (ceiling.current_rate() != 50) {
    return fail("test_rate_stays_within_bounds", "rate must never exceed max_rate");
  }

  AdaptiveRateOptions bad = clock.options(10);
  bad.min_rate = 20;
  bool threw = false;
  try {
    AdaptiveRateController invalid(bad);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_rate_stays_within_bounds", "initial_rate outside the bounds must be rejected");
  }
  return 0;
}

int test_rollover_retunes_every_host() {
  FakeClock clock;
  AdaptiveRateController controller(clock.options(20));

  auto& alpha = controller.limiter("alpha");
  auto& beta = controller.limiter("beta");
  controller.set_host_rate("beta", 3);
  if (beta.max_requests() != 3 || alpha.max_requests() != 20) {
    return fail("test_rollover_retunes_every_host", "host override should only touch that host");
  }

  report_many(controller, "alpha", 0, 10);
  clock.advance(10.0);
  controller.report_result("alpha", false);

  if (controller.current_rate() != 18 || alpha.max_requests() != 18 || beta.max_requests() != 18) {
    return fail("test_rollover_retunes_every_host", "rollover must push the new rate to all limiters");
  }
  if (&controller.limiter("alpha") != &alpha || controller.stats().hosts != 2) {
    return fail("test_rollover_retunes_every_host", "limiter lookup must return the existing instance");
  }

  auto& gamma = controller.limiter("gamma");
  if (gamma.max_requests() != 18 || gamma.time_window() != 1.0 || gamma.global_limit()) {
    return fail("test_rollover_retunes_every_host", "new limiters start per host at the current rate over limiter_window_s");
  }

  bool threw = false;
  try {
    controller.set_host_rate("alpha", 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_rollover_retunes_every_host", "non-positive host rate must be rejected");
  }
  return 0;
}

int test_retune_listener_sees_rate_changes() {
  FakeClock clock;
  std::vector<pacer::rate::RateChange> changes;
  AdaptiveRateOptions options = clock.options(10);
  options.on_retune = [&changes](const pacer::rate::RateChange& change) { changes.push_back(change); };
  AdaptiveRateController controller(options);

  report_many(controller, "h", 8, 1);
  clock.advance(10.0);
  controller.report_result("h", false);
  if (!changes.empty()) {
    return fail("test_retune_listener_sees_rate_changes", "an unchanged rate must not notify");
  }

  report_many(controller, "h", 5, 14);
  clock.advance(10.0);
  controller.report_result("h", false);
  if (changes.size() != 1 || changes[0].previous != 10 || changes[0].current != 9 ||
      std::fabs(changes[0].success_rate - 0.25) > 1e-9) {
    return fail("test_retune_listener_sees_rate_changes", "listener should receive the 10 -> 9 retune");
  }

  // The listener runs outside the controller lock and may call back into it.
  AdaptiveRateOptions reentrant = clock.options(10);
  int observed_rate = 0;
  AdaptiveRateController* self = nullptr;
  reentrant.on_retune = [&observed_rate, &self](const pacer::rate::RateChange&) {
    observed_rate = self->current_rate();
  };
  AdaptiveRateController second(reentrant);
  self = &second;
  report_many(second, "h", 20, 0);
  clock.advance(10.0);
  second.report_result("h", true);
  if (observed_rate != 11) {
    return fail("test_retune_listener_sees_rate_changes", "listener should be able to read the new rate");
  }
  return 0;
}

int test_limiter_lookup_is_thread_safe() {
  AdaptiveRateController controller;
  std::vector<SlidingWindowRateLimiter*> seen(16, nullptr);
  std::vector<std::thread> callers;
  for (std::size_t i = 0; i < seen.size(); ++i) {
    callers.emplace_back([&controller, &seen, i]() { seen[i] = &controller.limiter("contended"); });
  }
  for (auto& caller : callers) {
    caller.join();
  }

  for (const auto* limiter : seen) {
    if (limiter != seen.front()) {
      return fail("test_limiter_lookup_is_thread_safe", "concurrent callers must share one limiter");
    }
  }
  if (controller.stats().hosts != 1) {
    return fail("test_limiter_lookup_is_thread_safe", "only one limiter may be created per host");
  }
  return 0;
}

int test_should_delay_tracks_capacity() {
  AdaptiveRateOptions options{};
  options.initial_rate = 2;
  AdaptiveRateController controller(options);

  if (controller.should_delay("h")) {
    return fail("test_should_delay_tracks_capacity", "fresh host has capacity");
  }
  (void)controller.wait_if_needed("h");
  (void)controller.wait_if_needed("h");
  if (!controller.should_delay("h")) {
    return fail("test_should_delay_tracks_capacity", "host at its limit should be delayed");
  }
  if (controller.should_delay("other")) {
    return fail("test_should_delay_tracks_capacity", "other hosts keep their own budget");
  }
  return 0;
}

int test_delay_injector_bounds() {
  DelayInjector injector(0.1, 0.05, 42);
  for (int i = 0; i < 200; ++i) {
    const double delay = injector.get_delay("h");
    if (delay < 0.05 - 1e-12 || delay > 0.15 + 1e-12) {
      return fail("test_delay_injector_bounds", "delay must stay within base plus or minus jitter");
    }
  }

  injector.set_host_delay("slow", 1.0);
  const double slow = injector.get_delay("slow");
  if (slow < 0.95 || slow > 1.05) {
    return fail("test_delay_injector_bounds", "host override replaces the base delay");
  }
  injector.clear_host_delay("slow");
  if (injector.get_delay("slow") > 0.15 + 1e-12) {
    return fail("test_delay_injector_bounds", "cleared override falls back to the base delay");
  }

  DelayInjector clamped(0.0, 0.5, 7);
  for (int i = 0; i < 200; ++i) {
    if (clamped.get_delay("h") < 0.0) {
      return fail("test_delay_injector_bounds", "delay must never be negative");
    }
  }

  DelayInjector silent(0.0, 0.0);
  if (silent.apply_delay("h") != 0.0) {
    return fail("test_delay_injector_bounds", "zero base and jitter means no pause");
  }

  DelayInjector fixed(0.03, 0.0);
  const auto start = std::chrono::steady_clock::now();
  const double slept = fixed.apply_delay("h");
  const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  if (std::fabs(slept - 0.03) > 1e-9 || elapsed < 0.03) {
    return fail("test_delay_injector_bounds", "apply_delay should sleep the computed delay");
  }

  int rejected = 0;
  try {
    DelayInjector negative(-0.1, 0.0);
  } catch (const std::invalid_argument&) {
    ++rejected;
  }
  try {
    fixed.set_host_delay("h", -1.0);
  } catch (const std::invalid_argument&) {
    ++rejected;
  }
  if (rejected != 2) {
    return fail("test_delay_injector_bounds", "negative delays must be rejected");
  }
  return 0;
}

int test_optimal_thread_count() {
  const resource_snapshot busy{90.0F, 40.0F, 0, 0, 0};
  const resource_snapshot swapping{20.0F, 85.0F, 0, 0, 0};
  const resource_snapshot idle{10.0F, 30.0F, 0, 0, 0};
  const resource_snapshot moderate{50.0F, 60.0F, 0, 0, 0};

  if (optimal_thread_count(10, busy) != 5 || optimal_thread_count(10, swapping) != 5) {
    return fail("test_optimal_thread_count", "heavy load halves the base count");
  }
  if (optimal_thread_count(1, busy) != 1) {
    return fail("test_optimal_thread_count", "halving never goes below one thread");
  }
  if (optimal_thread_count(10, idle) != 20 || optimal_thread_count(40, idle) != 50) {
    return fail("test_optimal_thread_count", "idle host doubles the base count up to the cap");
  }
  if (optimal_thread_count(std::numeric_limits<int>::max(), idle) != 50 || optimal_thread_count(26, idle) != 50 ||
      optimal_thread_count(25, idle) != 50 || optimal_thread_count(24, idle) != 48) {
    return fail("test_optimal_thread_count", "doubling must cap at 50 without overflowing");
  }
  if (optimal_thread_count(10, moderate) != 10) {
    return fail("test_optimal_thread_count", "moderate load keeps the base count");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_limiter_blocks_fourth_request(); rc != 0) return rc;
  if (int rc = test_check_is_idempotent(); rc != 0) return rc;
  if (int rc = test_scopes_are_isolated(); rc != 0) return rc;
  if (int rc = test_global_mode_shares_one_window(); rc != 0) return rc;
  if (int rc = test_entries_expire_after_window(); rc != 0) return rc;
  if (int rc = test_concurrent_waits_never_overadmit(); rc != 0) return rc;
  if (int rc = test_invalid_limiter_arguments(); rc != 0) return rc;
  if (int rc = test_rate_increases_on_high_success(); rc != 0) return rc;
  if (int rc = test_rate_decreases_on_low_success(); rc != 0) return rc;
  if (int rc = test_rate_stays_within_bounds(); rc != 0) return rc;
  if (int rc = test_rollover_retunes_every_host(); rc != 0) return rc;
  if (int rc = test_retune_listener_sees_rate_changes(); rc != 0) return rc;
  if (int rc = test_limiter_lookup_is_thread_safe(); rc != 0) return rc;
  if (int rc = test_should_delay_tracks_capacity(); rc != 0) return rc;
  if (int rc = test_delay_injector_bounds(); rc != 0) return rc;
  if (int rc = test_optimal_thread_count(); rc != 0) return rc;

  std::cout << "[PASS] rate unit tests\n";
  return 0;
}
