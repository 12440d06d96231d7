#pragma once

#include "model/health.hpp"

namespace decision_agent::safety {

// The one thing telemetry recorders may do to the safety state machine.
class PanicTrigger {
 public:
  virtual ~PanicTrigger() = default;

  virtual void trigger(const model::PanicStopReason& reason) = 0;
};

}  // namespace decision_agent::safety
