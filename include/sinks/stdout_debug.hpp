#pragma once

#include "model/engine_event.hpp"
#include "model/engine_frame.hpp"

namespace pacer::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::engine_frame& frame) const;
  void publish(const model::engine_event& event) const;
};

}  // namespace pacer::sinks
