#include "consistency/state_consistency.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace decision_agent::consistency {
namespace {

std::string format_chips(const double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

}  // namespace

ConsistencyFrame frame_from_state(const model::GameState& state, std::vector<std::string> parse_errors) {
  ConsistencyFrame frame{};
  frame.hand_id = state.hand_id;
  frame.on_street = state.on_street;
  frame.pot = state.pot;
  frame.stacks = state.stacks;
  frame.confidence = state.confidence;
  frame.parse_errors = std::move(parse_errors);
  return frame;
}

StateConsistencyChecker::StateConsistencyChecker(ConsistencyOptions options) : options_(options) {}

std::vector<std::string> StateConsistencyChecker::observe(const ConsistencyFrame& frame) {
  std::vector<std::string> violations;
  if (previous_.has_value() && previous_->hand_id == frame.hand_id) {
    violations = compare(*previous_, frame);
  }
  previous_ = frame;

  if (!violations.empty() || !frame.parse_errors.empty()) {
    ++consecutive_error_frames_;
  } else {
    consecutive_error_frames_ = 0;
  }
  return violations;
}

bool StateConsistencyChecker::should_trigger_emergency_stop(const std::uint32_t threshold) const noexcept {
  return consecutive_error_frames_ >= threshold;
}

void StateConsistencyChecker::reset() noexcept {
  previous_.reset();
  consecutive_error_frames_ = 0;
}

std::vector<std::string> StateConsistencyChecker::compare(const ConsistencyFrame& previous,
                                                          const ConsistencyFrame& current) const {
  std::vector<std::string> violations;
  const double tolerance = options_.tolerance;
  const double pot_delta = current.pot - previous.pot;

  if (pot_delta < -tolerance) {
    violations.push_back("Pot decreased from " + format_chips(previous.pot) + " to " + format_chips(current.pot));
  }

  // Stack growth is only legal when the pot paid for it.
  double stack_delta = 0.0;
  double total_increase = 0.0;
  std::vector<std::pair<std::string, std::pair<double, double>>> increases;
  for (const auto& [position, stack] : current.stacks) {
    const auto prev = previous.stacks.find(position);
    if (prev == previous.stacks.end()) {
      continue;
    }
    const double delta = stack - prev->second;
    stack_delta += delta;
    if (delta > tolerance) {
      total_increase += delta;
      increases.push_back({position, {prev->second, stack}});
    }
  }

  const double pot_paid_out = pot_delta < 0.0 ? -pot_delta : 0.0;
  if (total_increase > pot_paid_out + tolerance) {
    for (const auto& [position, change] : increases) {
      violations.push_back("Stack increased unexpectedly for " + position + ": " + format_chips(change.first) +
                           " -> " + format_chips(change.second));
    }
  }

  const double residual = stack_delta + pot_delta;
  if (std::fabs(residual) > tolerance) {
    violations.push_back("Chip conservation violated: stacks changed by " + format_chips(stack_delta) +
                         ", pot by " + format_chips(pot_delta) + " (residual " + format_chips(residual) + ")");
  }

  const double confidence_drop = previous.confidence - current.confidence;
  if (confidence_drop > options_.max_confidence_drop) {
    std::ostringstream message;
    message << "Sudden confidence drop: " << std::fixed << std::setprecision(2) << confidence_drop;
    violations.push_back(message.str());
  }

  return violations;
}

}  // namespace decision_agent::consistency
