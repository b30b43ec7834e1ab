#pragma once

#include <cstdint>
#include <type_traits>

namespace pacer::model {

// Telemetry frame published once per sampling cycle.
// POD layout: one timestamp + tightly packed signals.
struct engine_frame {
    struct AgentHealth {
        std::uint64_t heartbeat_ms;
        std::uint32_t redis_errors;
        std::uint32_t sampler_failures;
    };

    std::uint64_t timestamp;

    // Host load.
    float cpu;
    float memory;

    // Worker pool.
    std::uint32_t workers;
    std::uint32_t active;
    std::uint32_t pending;

    // Adaptive rate control.
    std::uint32_t current_rate;
    std::uint32_t hosts;
    std::uint32_t window_successes;
    std::uint32_t window_failures;
    std::uint32_t rate_adjustments;

    AgentHealth agent;
};

static_assert(std::is_standard_layout_v<engine_frame>, "engine_frame must be standard layout");
static_assert(std::is_trivial_v<engine_frame>, "engine_frame must be trivial");

} // namespace pacer::model
