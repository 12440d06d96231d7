#pragma once

#include <memory>
#include <string>

#include "budget/time_budget_tracker.hpp"
#include "core/logger.hpp"
#include "decision/collaborators.hpp"
#include "decision/deadline.hpp"
#include "model/decision.hpp"
#include "model/game_state.hpp"

namespace decision_agent::decision {

inline constexpr double kDefaultGtoBudgetMs = 400.0;
inline constexpr double kDefaultAdvisorCapMs = 200.0;

struct DecisionPipelineDeps {
  std::shared_ptr<StrategyEngine> strategy_engine{};
  std::shared_ptr<Solver> solver{};
  std::shared_ptr<AdvisorEnsemble> advisors{};
  std::shared_ptr<budget::TimeBudgetTracker> tracker{};
  double gto_budget_ms{kDefaultGtoBudgetMs};
  double advisor_cap_ms{kDefaultAdvisorCapMs};
  std::shared_ptr<core::Logger> logger{};
  // Raised while an abandoned call is still running; the stage is skipped
  // until it clears. Copies of the deps share these.
  std::shared_ptr<InFlightFlag> solver_in_flight{std::make_shared<InFlightFlag>(false)};
  std::shared_ptr<InFlightFlag> advisors_in_flight{std::make_shared<InFlightFlag>(false)};
};

struct DecisionPipelineResult {
  model::StrategyDecision decision{};
  model::SolverSolution solver_result{};
  model::AdvisorOutput advisor_result{};
  bool solver_timed_out{false};
};

// Runs one decision cycle and always returns a decision. Solver and advisor
// failures of any exception type, empty solutions, missed deadlines and
// still-running earlier calls fall back locally; only a missing solver or
// strategy engine throws (std::invalid_argument).
DecisionPipelineResult make_decision(const model::GameState& state, const std::string& session_id,
                                     const DecisionPipelineDeps& deps);

// Least committal legal action for the hero (check/call, else fold) at
// frequency 1 and zero EV.
model::SolverSolution make_safe_fallback_solution(const model::GameState& state);

// "No signal" advisor output: zero weights, no consensus, nothing spent.
model::AdvisorOutput make_stub_advisor_output(const std::string& reason);

}  // namespace decision_agent::decision
