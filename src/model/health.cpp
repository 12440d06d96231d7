#include "model/health.hpp"

namespace decision_agent::model {

const char* to_string(const health_state state) noexcept {
  switch (state) {
    case health_state::HEALTHY:
      return "healthy";
    case health_state::DEGRADED:
      return "degraded";
    case health_state::FAILED:
      return "failed";
  }
  return "failed";
}

const char* to_string(const panic_type type) noexcept {
  switch (type) {
    case panic_type::VISION_CONFIDENCE:
      return "vision_confidence";
    case panic_type::RISK_LIMIT:
      return "risk_limit";
    case panic_type::MANUAL:
      return "manual";
  }
  return "manual";
}

health_state compute_overall_health(const std::vector<HealthStatus>& statuses) noexcept {
  health_state overall = health_state::HEALTHY;
  for (const auto& status : statuses) {
    if (status.state > overall) {
      overall = status.state;
    }
  }
  return overall;
}

}  // namespace decision_agent::model
