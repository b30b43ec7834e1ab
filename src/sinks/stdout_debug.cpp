#include "sinks/stdout_debug.hpp"

#include <cinttypes>
#include <cstdio>

namespace pacer::sinks {

void StdoutDebugSink::publish(const model::engine_frame& frame) const {
  std::printf("[frame] cpu_pct=%.2f memory_pct=%.2f workers=%u active=%u pending=%u rate=%u hosts=%u ok=%u fail=%u\n",
              frame.cpu, frame.memory, frame.workers, frame.active, frame.pending, frame.current_rate, frame.hosts,
              frame.window_successes, frame.window_failures);
  std::fflush(stdout);
}

void StdoutDebugSink::publish(const model::engine_event& event) const {
  if (event.kind == model::engine_event::Kind::pool_resized) {
    std::printf("[event] %s %" PRId64 " -> %" PRId64 " cpu_pct=%.2f memory_pct=%.2f\n", model::to_string(event.kind),
                event.from, event.to, event.cpu, event.memory);
  } else {
    std::printf("[event] %s %" PRId64 " -> %" PRId64 " success_rate=%.3f\n", model::to_string(event.kind), event.from,
                event.to, event.success_rate);
  }
  std::fflush(stdout);
}

}  // namespace pacer::sinks
