#include "sinks/stdout_debug.hpp"

#include <string>

#include "sinks/json_encoding.hpp"

namespace decision_agent::sinks {

void StdoutDebugSink::publish(const model::HealthSnapshot& snapshot) const {
  const std::string line = to_json(snapshot).dump();
  std::fprintf(out_, "%s\n", line.c_str());
  std::fflush(out_);
}

}  // namespace decision_agent::sinks
