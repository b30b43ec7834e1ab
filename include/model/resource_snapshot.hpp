#pragma once

#include <cstdint>
#include <type_traits>

namespace pacer::model {

// One sampler reading. Immutable once appended to history.
struct resource_snapshot {
    float cpu_percent;
    float memory_percent;
    std::uint32_t active_worker_count;
    std::uint32_t pending_queue_depth;
    std::uint64_t timestamp_ns;
};

static_assert(std::is_trivial_v<resource_snapshot>, "resource_snapshot must be trivial");

} // namespace pacer::model
