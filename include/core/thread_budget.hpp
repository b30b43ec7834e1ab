#pragma once

#include "model/resource_snapshot.hpp"

namespace pacer::core {

constexpr int kMaxThreadBudget = 50;

// Halves base_count under heavy load (CPU or memory above 80%), doubles it
// up to kMaxThreadBudget when the host is mostly idle, otherwise keeps it.
int optimal_thread_count(int base_count, const model::resource_snapshot& snapshot) noexcept;

}  // namespace pacer::core
