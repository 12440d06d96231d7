#include "sinks/json_encoding.hpp"

#include <type_traits>
#include <variant>

namespace decision_agent::sinks {
namespace {

nlohmann::json safe_mode_json(const model::SafeModeState& state) {
  return std::visit(
      [](const auto& value) -> nlohmann::json {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, model::SafeModeActive>) {
          return {{"active", true},
                  {"reason", value.reason},
                  {"entered_at", value.entered_at_ms},
                  {"manual", value.manual}};
        } else {
          return {{"active", false}};
        }
      },
      state);
}

nlohmann::json action_json(const model::Action& action) {
  nlohmann::json out = {{"type", model::to_string(action.type)},
                        {"position", action.position},
                        {"street", model::to_string(action.on_street)}};
  if (action.amount.has_value()) {
    out["amount"] = *action.amount;
  }
  return out;
}

}  // namespace

nlohmann::json to_json(const model::HealthStatus& status) {
  nlohmann::json out = {{"component", status.component},
                        {"state", model::to_string(status.state)},
                        {"checked_at", status.checked_at_ms},
                        {"consecutive_failures", status.consecutive_failures},
                        {"metrics", status.metrics}};
  if (status.details.has_value()) {
    out["details"] = *status.details;
  }
  return out;
}

nlohmann::json to_json(const model::HealthSnapshot& snapshot) {
  nlohmann::json statuses = nlohmann::json::array();
  for (const auto& status : snapshot.statuses) {
    statuses.push_back(to_json(status));
  }

  nlohmann::json out = {{"id", snapshot.id},
                        {"overall", model::to_string(snapshot.overall)},
                        {"statuses", std::move(statuses)},
                        {"safe_mode", safe_mode_json(snapshot.safe_mode)},
                        {"issued_at", snapshot.issued_at_ms}};
  if (snapshot.panic_stop.has_value()) {
    out["panic_stop"] = {{"type", model::to_string(snapshot.panic_stop->type)},
                         {"detail", snapshot.panic_stop->detail},
                         {"triggered_at", snapshot.panic_stop->triggered_at_ms}};
  } else {
    out["panic_stop"] = nullptr;
  }
  return out;
}

nlohmann::json to_json(const model::StrategyDecision& decision) {
  nlohmann::json reasoning = {{"alpha", decision.reasoning.alpha},
                              {"divergence_pp", decision.reasoning.divergence_pp},
                              {"risk_check_passed", decision.reasoning.risk_check_passed},
                              {"panic_stop", decision.reasoning.panic_stop}};
  if (decision.reasoning.fallback_reason.has_value()) {
    reasoning["fallback_reason"] = *decision.reasoning.fallback_reason;
  }

  return {{"action", action_json(decision.action)},
          {"reasoning", std::move(reasoning)},
          {"timing",
           {{"gto_ms", decision.timing.gto_ms},
            {"agent_ms", decision.timing.agent_ms},
            {"synthesis_ms", decision.timing.synthesis_ms},
            {"total_ms", decision.timing.total_ms}}},
          {"metadata",
           {{"preempted", decision.metadata.preempted},
            {"used_gto_only_fallback", decision.metadata.used_gto_only_fallback},
            {"panic_stop", decision.metadata.panic_stop}}}};
}

}  // namespace decision_agent::sinks
