#pragma once

#include <string>

#include "decision/collaborators.hpp"

namespace decision_agent::decision {

// Spreads frequency evenly over the hero's legal actions at zero EV.
// Stands in for the real solver in the replay binary.
class UniformSolver final : public Solver {
 public:
  model::SolverSolution solve(const model::GameState& state, double budget_ms) override;
};

// alpha * solver + (1 - alpha) * advisors per action type; solver only when
// the advisors carry no signal. Ties resolve to the least committal action.
class BlendingStrategyEngine final : public StrategyEngine {
 public:
  explicit BlendingStrategyEngine(double alpha = 0.7);

  model::StrategyDecision decide(const model::GameState& state, const model::SolverSolution& solution,
                                 const model::AdvisorOutput& advisors, const std::string& session_id) override;

 private:
  double alpha_;
};

}  // namespace decision_agent::decision
