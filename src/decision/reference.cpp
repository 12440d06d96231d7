#include "decision/reference.hpp"

#include <chrono>
#include <cmath>

#include "core/math.hpp"

namespace decision_agent::decision {
namespace {

// Least committal first; used to break ties.
constexpr model::action_type kCommitmentOrder[] = {
    model::action_type::CHECK,
    model::action_type::CALL,
    model::action_type::FOLD,
    model::action_type::RAISE,
};

}  // namespace

model::SolverSolution UniformSolver::solve(const model::GameState& state, const double /*budget_ms*/) {
  model::SolverSolution solution{};
  solution.source = "uniform";

  std::size_t hero_actions = 0;
  for (const auto& action : state.legal_actions) {
    if (action.position == state.hero) {
      ++hero_actions;
    }
  }
  if (hero_actions == 0) {
    return solution;
  }

  const double frequency = 1.0 / static_cast<double>(hero_actions);
  for (const auto& action : state.legal_actions) {
    if (action.position == state.hero) {
      solution.entries.push_back(model::SolverEntry{action, frequency, 0.0});
    }
  }
  return solution;
}

BlendingStrategyEngine::BlendingStrategyEngine(const double alpha) : alpha_(core::clamp01(alpha)) {}

model::StrategyDecision BlendingStrategyEngine::decide(const model::GameState& state,
                                                       const model::SolverSolution& solution,
                                                       const model::AdvisorOutput& advisors,
                                                       const std::string& /*session_id*/) {
  const auto started = std::chrono::steady_clock::now();
  model::StrategyDecision decision{};

  model::ActionWeights gto{};
  double gto_total = 0.0;
  for (const auto& entry : solution.entries) {
    gto[static_cast<std::size_t>(entry.action.type)] += entry.frequency;
    gto_total += entry.frequency;
  }
  if (gto_total > 0.0) {
    for (double& weight : gto) {
      weight /= gto_total;
    }
  }

  double advisor_total = 0.0;
  for (const double weight : advisors.weights) {
    advisor_total += weight;
  }
  const bool advisor_signal = advisor_total > 0.0;
  const double alpha = advisor_signal ? alpha_ : 1.0;

  model::ActionWeights blended{};
  double divergence = 0.0;
  for (std::size_t i = 0; i < blended.size(); ++i) {
    const double agent = advisor_signal ? advisors.weights[i] / advisor_total : 0.0;
    blended[i] = (alpha * gto[i]) + ((1.0 - alpha) * agent);
    if (advisor_signal) {
      divergence = std::fmax(divergence, std::fabs(gto[i] - agent) * 100.0);
    }
  }

  auto best = kCommitmentOrder[0];
  for (const auto type : kCommitmentOrder) {
    if (model::weight_of(blended, type) > model::weight_of(blended, best)) {
      best = type;
    }
  }

  bool chosen = false;
  for (const auto& entry : solution.entries) {
    if (entry.action.type == best) {
      decision.action = entry.action;
      chosen = true;
      break;
    }
  }
  if (!chosen) {
    for (const auto& action : state.legal_actions) {
      if (action.position == state.hero && action.type == best) {
        decision.action = action;
        chosen = true;
        break;
      }
    }
  }
  if (!chosen && !solution.entries.empty()) {
    decision.action = solution.entries.front().action;
    chosen = true;
  }
  if (!chosen) {
    decision.action.type = model::action_type::FOLD;
    decision.action.position = state.hero;
    decision.action.on_street = state.on_street;
    decision.reasoning.fallback_reason = "no_legal_action";
  }

  decision.reasoning.alpha = alpha;
  decision.reasoning.divergence_pp = divergence;
  decision.metadata.used_gto_only_fallback = !advisor_signal;
  if (solution.source == "safe_fallback" && !decision.reasoning.fallback_reason.has_value()) {
    decision.reasoning.fallback_reason = "solver_fallback";
  }

  const auto finished = std::chrono::steady_clock::now();
  decision.timing.gto_ms = solution.compute_time_ms;
  decision.timing.agent_ms = advisors.budget_used_ms;
  decision.timing.synthesis_ms =
      std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(finished - started).count();
  decision.timing.total_ms = decision.timing.gto_ms + decision.timing.agent_ms + decision.timing.synthesis_ms;
  return decision;
}

}  // namespace decision_agent::decision
