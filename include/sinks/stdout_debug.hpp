#pragma once

#include <cstdio>

#include "model/health.hpp"

namespace decision_agent::sinks {

// One compact JSON object per snapshot, newline terminated.
class StdoutDebugSink {
 public:
  explicit StdoutDebugSink(std::FILE* out = stdout) : out_(out) {}

  void publish(const model::HealthSnapshot& snapshot) const;

 private:
  std::FILE* out_;
};

}  // namespace decision_agent::sinks
