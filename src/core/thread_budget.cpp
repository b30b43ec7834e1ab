#include "core/thread_budget.hpp"

#include <algorithm>

namespace pacer::core {

int optimal_thread_count(const int base_count, const model::resource_snapshot& snapshot) noexcept {
  if (snapshot.cpu_percent > 80.0F || snapshot.memory_percent > 80.0F) {
    return std::max(1, base_count / 2);
  }
  if (snapshot.cpu_percent < 30.0F && snapshot.memory_percent < 50.0F) {
    return base_count > kMaxThreadBudget / 2 ? kMaxThreadBudget : base_count * 2;
  }
  return base_count;
}

}  // namespace pacer::core
