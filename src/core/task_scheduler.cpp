#include "core/task_scheduler.hpp"

namespace pacer::core {

TaskScheduler::TaskScheduler(AdaptiveWorkerPool& pool, RetryPolicy default_policy)
    : pool_(pool), default_policy_(default_policy) {}

std::chrono::duration<double> TaskScheduler::backoff_delay(const double backoff_factor, const unsigned attempt) {
  return std::chrono::duration<double>(backoff_factor * std::ldexp(1.0, static_cast<int>(attempt)));
}

}  // namespace pacer::core
