#pragma once

#include <cstdint>

namespace pacer::model {

// One engine transition: a pool resize or an adaptive rate retune.
struct engine_event {
  enum class Kind : std::uint8_t { pool_resized, rate_retuned };

  Kind kind;
  std::uint64_t timestamp_ms;
  std::int64_t from;
  std::int64_t to;

  // pool_resized: the load sample that triggered the step.
  float cpu;
  float memory;
  // rate_retuned: success ratio of the window that just closed.
  double success_rate;
};

inline const char* to_string(const engine_event::Kind kind) noexcept {
  switch (kind) {
    case engine_event::Kind::pool_resized:
      return "pool_resized";
    case engine_event::Kind::rate_retuned:
      return "rate_retuned";
  }
  return "unknown";
}

}  // namespace pacer::model
