#pragma once

#include <string>

#include "model/decision.hpp"
#include "model/game_state.hpp"

namespace decision_agent::decision {

// Concurrency: a solve() or query() that misses its deadline is abandoned,
// not cancelled, and keeps running on a worker thread until it returns. The
// pipeline makes no further call on that collaborator until it has, so at
// most one call per instance is in flight and implementations need not be
// re-entrant. Calls may arrive on different threads.

// Game-theory solver. A zero budget asks for the cached/fastest answer.
// May throw anything; may return a solution without entries.
class Solver {
 public:
  virtual ~Solver() = default;

  virtual model::SolverSolution solve(const model::GameState& state, double budget_ms) = 0;
};

struct PromptContext {
  std::string request_id;
  double time_budget_ms{0.0};
};

struct AdvisorQueryOptions {
  double budget_override_ms{0.0};
};

// Ensemble of LLM-backed advisors. May throw anything.
class AdvisorEnsemble {
 public:
  virtual ~AdvisorEnsemble() = default;

  virtual model::AdvisorOutput query(const model::GameState& state, const PromptContext& context,
                                     const AdvisorQueryOptions& options) = 0;
};

// Blends solver and advisor signals into the final action. Must not throw:
// risk or blend failures resolve to a decision inside the engine.
class StrategyEngine {
 public:
  virtual ~StrategyEngine() = default;

  virtual model::StrategyDecision decide(const model::GameState& state, const model::SolverSolution& solution,
                                         const model::AdvisorOutput& advisors, const std::string& session_id) = 0;
};

}  // namespace decision_agent::decision
