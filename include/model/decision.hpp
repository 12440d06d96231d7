#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/game_state.hpp"

namespace decision_agent::model {

struct SolverEntry {
  Action action{};
  double frequency{0.0};
  double expected_value{0.0};
};

struct SolverSolution {
  std::vector<SolverEntry> entries{};
  double exploitability{0.0};
  double compute_time_ms{0.0};
  std::string source{"subgame"};
};

// Normalized weight per action_type, indexed by its underlying value.
using ActionWeights = std::array<double, 4>;

struct AdvisorOutput {
  ActionWeights weights{};
  double consensus{0.0};
  std::optional<action_type> winning_action{};
  double budget_used_ms{0.0};
  bool circuit_breaker_tripped{false};
  std::string notes{};
  std::uint64_t started_at_ms{0};
  std::uint64_t completed_at_ms{0};
};

inline double weight_of(const ActionWeights& weights, const action_type type) {
  return weights[static_cast<std::size_t>(type)];
}

struct StrategyReasoning {
  double alpha{0.0};
  double divergence_pp{0.0};
  bool risk_check_passed{true};
  std::optional<std::string> fallback_reason{};
  bool panic_stop{false};
};

struct StrategyTiming {
  double gto_ms{0.0};
  double agent_ms{0.0};
  double synthesis_ms{0.0};
  double total_ms{0.0};
};

struct StrategyMetadata {
  bool preempted{false};
  bool used_gto_only_fallback{false};
  bool panic_stop{false};
};

struct StrategyDecision {
  Action action{};
  StrategyReasoning reasoning{};
  StrategyTiming timing{};
  StrategyMetadata metadata{};
};

}  // namespace decision_agent::model
