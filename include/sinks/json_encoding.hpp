#pragma once

#include <nlohmann/json.hpp>

#include "model/decision.hpp"
#include "model/health.hpp"

namespace decision_agent::sinks {

nlohmann::json to_json(const model::HealthStatus& status);
nlohmann::json to_json(const model::HealthSnapshot& snapshot);
nlohmann::json to_json(const model::StrategyDecision& decision);

}  // namespace decision_agent::sinks
