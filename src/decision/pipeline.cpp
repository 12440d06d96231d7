#include "decision/pipeline.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "core/timestamp.hpp"
#include "decision/deadline.hpp"

namespace decision_agent::decision {
namespace {

constexpr const char* kTag = "pipeline";

using budget::budget_component;

model::SolverSolution solve_inline(Solver& solver, const model::GameState& state) {
  return solver.solve(state, 0.0);
}

struct SolverOutcome {
  model::SolverSolution solution{};
  bool timed_out{false};
};

// Reservation, bracketing and deadline handling around one solver call.
// Throws whatever the solver throws, after the GTO bracket is closed.
SolverOutcome run_solver(const model::GameState& state, const DecisionPipelineDeps& deps) {
  auto& tracker = deps.tracker;
  core::Logger& log = core::logger_or_null(deps.logger);

  if (deps.solver_in_flight != nullptr && deps.solver_in_flight->load()) {
    log.warn(kTag, "previous GTO solver call still running, using safe fallback (hand " + state.hand_id + ")");
    return {make_safe_fallback_solution(state), true};
  }

  if (tracker != nullptr && tracker->should_preempt(budget_component::GTO)) {
    log.debug(kTag, "gto stage preempted; using zero-budget solve");
    return {solve_inline(*deps.solver, state), true};
  }

  const double default_budget = deps.gto_budget_ms;
  const double remaining = tracker != nullptr ? tracker->remaining(budget_component::GTO) : default_budget;
  const double requested = std::max(0.0, std::min(default_budget, remaining));
  const bool reserved = tracker != nullptr ? tracker->reserve(budget_component::GTO, requested) : true;
  if (!reserved || requested <= 0.0) {
    log.debug(kTag, "gto reservation refused; using zero-budget solve");
    return {solve_inline(*deps.solver, state), true};
  }

  if (tracker != nullptr) {
    tracker->start_component(budget_component::GTO);
  }

  std::optional<model::SolverSolution> solved;
  std::exception_ptr failure;
  try {
    solved = call_with_deadline(
        [solver = deps.solver, state, requested]() { return solver->solve(state, requested); }, requested,
        deps.solver_in_flight);
  } catch (...) {
    failure = std::current_exception();
  }

  const double actual = tracker != nullptr ? tracker->end_component(budget_component::GTO) : requested;
  if (tracker != nullptr && requested > actual) {
    tracker->release(budget_component::GTO, requested - actual);
  }

  if (failure != nullptr) {
    std::rethrow_exception(failure);
  }

  if (!solved.has_value()) {
    std::ostringstream message;
    message << "GTO solver missed its " << requested << "ms deadline, using safe fallback (hand "
            << state.hand_id << ')';
    log.warn(kTag, message.str());
    return {make_safe_fallback_solution(state), true};
  }

  return {std::move(*solved), false};
}

model::AdvisorOutput run_advisors(const model::GameState& state, const DecisionPipelineDeps& deps) {
  core::Logger& log = core::logger_or_null(deps.logger);
  if (deps.advisors == nullptr) {
    return make_stub_advisor_output("no advisors wired");
  }
  if (deps.advisors_in_flight != nullptr && deps.advisors_in_flight->load()) {
    log.warn(kTag, "previous advisor query still running, using stub output");
    return make_stub_advisor_output("previous advisor query still running");
  }

  auto& tracker = deps.tracker;
  const double cap = std::max(0.0, deps.advisor_cap_ms);
  const double remaining = tracker != nullptr ? tracker->remaining(budget_component::AGENTS) : cap;
  const double budget_ms = std::max(0.0, std::min(cap, remaining));
  if (budget_ms <= 0.0) {
    log.warn(kTag, "agents budget exhausted, using stub advisor output");
    return make_stub_advisor_output("agents budget exhausted");
  }

  PromptContext context{};
  context.request_id = "decision-" + state.hand_id + "-" + std::to_string(core::unix_timestamp_now_ms());
  context.time_budget_ms = budget_ms;
  AdvisorQueryOptions options{};
  options.budget_override_ms = cap;

  if (tracker != nullptr) {
    tracker->start_component(budget_component::AGENTS);
  }

  model::AdvisorOutput output{};
  try {
    auto answered = call_with_deadline(
        [advisors = deps.advisors, state, context, options]() { return advisors->query(state, context, options); },
        budget_ms, deps.advisors_in_flight);
    if (answered.has_value()) {
      output = std::move(*answered);
    } else {
      std::ostringstream message;
      message << "advisor query missed its " << budget_ms << "ms deadline, using stub output";
      log.warn(kTag, message.str());
      output = make_stub_advisor_output("advisor query missed deadline");
    }
  } catch (const std::exception& ex) {
    log.warn(kTag, std::string("advisor query failed, using stub output: ") + ex.what());
    output = make_stub_advisor_output(std::string("advisor query failed: ") + ex.what());
  } catch (...) {
    log.warn(kTag, "advisor query failed, using stub output: unknown error");
    output = make_stub_advisor_output("advisor query failed: unknown error");
  }

  if (tracker != nullptr) {
    tracker->end_component(budget_component::AGENTS);
  }
  return output;
}

}  // namespace

DecisionPipelineResult make_decision(const model::GameState& state, const std::string& session_id,
                                     const DecisionPipelineDeps& deps) {
  if (deps.solver == nullptr) {
    throw std::invalid_argument("decision pipeline requires a solver");
  }
  if (deps.strategy_engine == nullptr) {
    throw std::invalid_argument("decision pipeline requires a strategy engine");
  }

  core::Logger& log = core::logger_or_null(deps.logger);
  DecisionPipelineResult result{};

  try {
    auto outcome = run_solver(state, deps);
    result.solver_result = std::move(outcome.solution);
    result.solver_timed_out = outcome.timed_out;
  } catch (const std::exception& ex) {
    log.error(kTag, std::string("GTO solver failed, using safe fallback: ") + ex.what());
    result.solver_result = make_safe_fallback_solution(state);
    result.solver_timed_out = true;
  } catch (...) {
    log.error(kTag, "GTO solver failed, using safe fallback: unknown error");
    result.solver_result = make_safe_fallback_solution(state);
    result.solver_timed_out = true;
  }

  if (result.solver_result.entries.empty()) {
    log.warn(kTag, "empty GTO solution, using safe fallback (hand " + state.hand_id + ")");
    result.solver_result = make_safe_fallback_solution(state);
    result.solver_timed_out = true;
  }

  result.advisor_result = run_advisors(state, deps);
  result.decision = deps.strategy_engine->decide(state, result.solver_result, result.advisor_result, session_id);
  return result;
}

model::SolverSolution make_safe_fallback_solution(const model::GameState& state) {
  const model::Action* preferred = nullptr;
  const model::Action* fold = nullptr;
  for (const auto& action : state.legal_actions) {
    if (action.position != state.hero) {
      continue;
    }
    if (action.type == model::action_type::CHECK || action.type == model::action_type::CALL) {
      preferred = &action;
      break;
    }
    if (action.type == model::action_type::FOLD && fold == nullptr) {
      fold = &action;
    }
  }

  model::Action chosen{};
  if (preferred != nullptr) {
    chosen = *preferred;
  } else if (fold != nullptr) {
    chosen = *fold;
  } else {
    chosen.type = model::action_type::FOLD;
    chosen.position = state.hero;
    chosen.on_street = state.on_street;
  }

  model::SolverSolution solution{};
  solution.entries.push_back(model::SolverEntry{chosen, 1.0, 0.0});
  solution.exploitability = 1.0;
  solution.compute_time_ms = 0.0;
  solution.source = "safe_fallback";
  return solution;
}

model::AdvisorOutput make_stub_advisor_output(const std::string& reason) {
  const auto now = core::unix_timestamp_now_ms();

  model::AdvisorOutput output{};
  output.weights.fill(0.0);
  output.consensus = 0.0;
  output.winning_action = std::nullopt;
  output.budget_used_ms = 0.0;
  output.circuit_breaker_tripped = false;
  output.notes = "stubbed advisor output (" + reason + ")";
  output.started_at_ms = now;
  output.completed_at_ms = now;
  return output;
}

}  // namespace decision_agent::decision
