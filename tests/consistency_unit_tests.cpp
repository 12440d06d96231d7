#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "consistency/state_consistency.hpp"
#include "model/game_state.hpp"

using decision_agent::consistency::ConsistencyFrame;
using decision_agent::consistency::ConsistencyOptions;
using decision_agent::consistency::StateConsistencyChecker;
using decision_agent::consistency::frame_from_state;
using decision_agent::model::GameState;
using decision_agent::model::street;

namespace {

int fail(const char* name, const std::string& msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

ConsistencyFrame make_frame(const std::string& hand_id, double pot, std::map<std::string, double> stacks,
                            double confidence = 0.99) {
  ConsistencyFrame frame{};
  frame.hand_id = hand_id;
  frame.on_street = street::FLOP;
  frame.pot = pot;
  frame.stacks = std::move(stacks);
  frame.confidence = confidence;
  return frame;
}

bool has_prefix(const std::vector<std::string>& violations, const std::string& prefix) {
  for (const auto& violation : violations) {
    if (violation.rfind(prefix, 0) == 0) {
      return true;
    }
  }
  return false;
}

int test_pot_decrease_is_flagged() {
  StateConsistencyChecker checker{};
  (void)checker.observe(make_frame("h1", 20.0, {{"BTN", 80.0}, {"BB", 100.0}}));
  const auto violations = checker.observe(make_frame("h1", 15.0, {{"BTN", 85.0}, {"BB", 100.0}}));

  if (!has_prefix(violations, "Pot decreased from 20 to 15")) {
    return fail("test_pot_decrease_is_flagged", "pot decrease should be reported");
  }
  return 0;
}

int test_phantom_stack_increase_is_flagged() {
  StateConsistencyChecker checker{};
  (void)checker.observe(make_frame("h1", 10.0, {{"BTN", 100.0}, {"BB", 90.0}}));
  const auto violations = checker.observe(make_frame("h1", 10.0, {{"BTN", 105.0}, {"BB", 90.0}}));

  if (!has_prefix(violations, "Stack increased unexpectedly for BTN: 100 -> 105")) {
    return fail("test_phantom_stack_increase_is_flagged", "stack increase should be reported");
  }
  if (!has_prefix(violations, "Chip conservation violated")) {
    return fail("test_phantom_stack_increase_is_flagged", "created chips also break conservation");
  }
  return 0;
}

int test_conservation_catches_what_single_rules_miss() {
  StateConsistencyChecker checker{};
  (void)checker.observe(make_frame("h1", 3.0, {{"SB", 99.5}, {"BB", 99.0}}));
  const auto violations = checker.observe(make_frame("h1", 3.0, {{"SB", 99.0}, {"BB", 99.0}}));

  if (violations.size() != 1U) {
    return fail("test_conservation_catches_what_single_rules_miss", "exactly one violation expected");
  }
  if (violations.front() != "Chip conservation violated: stacks changed by -0.5, pot by 0 (residual -0.5)") {
    return fail("test_conservation_catches_what_single_rules_miss", "unexpected message: " + violations.front());
  }
  return 0;
}

int test_betting_and_payout_sequences() {
  StateConsistencyChecker checker{};
  (void)checker.observe(make_frame("h1", 10.0, {{"BTN", 100.0}, {"BB", 90.0}}));

  auto violations = checker.observe(make_frame("h1", 20.0, {{"BTN", 95.0}, {"BB", 85.0}}));
  if (!violations.empty()) {
    return fail("test_betting_and_payout_sequences", "chips moving into the pot are legal: " + violations.front());
  }

  violations = checker.observe(make_frame("h1", 0.0, {{"BTN", 115.0}, {"BB", 85.0}}));
  if (violations.size() != 1U || violations.front() != "Pot decreased from 20 to 0") {
    return fail("test_betting_and_payout_sequences", "payout should only trip the pot rule");
  }
  return 0;
}

int test_new_hand_resets_comparison() {
  StateConsistencyChecker checker{};
  (void)checker.observe(make_frame("h1", 40.0, {{"BTN", 60.0}, {"BB", 140.0}}));
  const auto violations = checker.observe(make_frame("h2", 3.0, {{"BTN", 99.0}, {"BB", 98.0}}, 0.2));

  if (!violations.empty()) {
    return fail("test_new_hand_resets_comparison", "a new hand id should not be compared");
  }
  if (!checker.previous().has_value() || checker.previous()->hand_id != "h2") {
    return fail("test_new_hand_resets_comparison", "new hand frame should be retained");
  }
  return 0;
}

int test_tolerance_is_configurable() {
  StateConsistencyChecker lenient{};
  (void)lenient.observe(make_frame("h1", 3.0, {{"SB", 99.5}}));
  if (!lenient.observe(make_frame("h1", 3.0, {{"SB", 99.495}})).empty()) {
    return fail("test_tolerance_is_configurable", "rounding noise should be tolerated by default");
  }

  ConsistencyOptions options{};
  options.tolerance = 0.001;
  StateConsistencyChecker strict{options};
  (void)strict.observe(make_frame("h1", 3.0, {{"SB", 99.5}}));
  if (!has_prefix(strict.observe(make_frame("h1", 3.0, {{"SB", 99.495}})), "Chip conservation violated")) {
    return fail("test_tolerance_is_configurable", "strict tolerance should flag the residual");
  }
  return 0;
}

int test_seat_changes_are_not_counted() {
  StateConsistencyChecker checker{};
  (void)checker.observe(make_frame("h1", 10.0, {{"BTN", 100.0}, {"BB", 90.0}}));
  const auto violations = checker.observe(make_frame("h1", 10.0, {{"BTN", 100.0}, {"BB", 90.0}, {"CO", 250.0}}));

  if (!violations.empty()) {
    return fail("test_seat_changes_are_not_counted", "seats missing from the earlier frame should be skipped");
  }
  return 0;
}

int test_confidence_drop_is_flagged() {
  StateConsistencyChecker checker{};
  (void)checker.observe(make_frame("h1", 10.0, {{"BTN", 100.0}}, 0.95));
  auto violations = checker.observe(make_frame("h1", 10.0, {{"BTN", 100.0}}, 0.6));
  if (violations.size() != 1U || violations.front() != "Sudden confidence drop: 0.35") {
    return fail("test_confidence_drop_is_flagged", "confidence drop above 0.3 should be reported");
  }

  violations = checker.observe(make_frame("h1", 10.0, {{"BTN", 100.0}}, 0.4));
  if (!violations.empty()) {
    return fail("test_confidence_drop_is_flagged", "a 0.2 drop is within the threshold");
  }
  return 0;
}

int test_consecutive_error_frames() {
  StateConsistencyChecker checker{};
  for (int i = 0; i < 5; ++i) {
    auto frame = make_frame("h" + std::to_string(i), 3.0, {{"BTN", 100.0}});
    frame.parse_errors.push_back("pot text unreadable");
    (void)checker.observe(frame);
    if (i < 4 && checker.should_trigger_emergency_stop()) {
      return fail("test_consecutive_error_frames", "emergency stop should wait for five frames");
    }
  }
  if (checker.consecutive_error_frames() != 5U || !checker.should_trigger_emergency_stop()) {
    return fail("test_consecutive_error_frames", "five bad frames should request an emergency stop");
  }

  (void)checker.observe(make_frame("h9", 3.0, {{"BTN", 100.0}}));
  if (checker.consecutive_error_frames() != 0U) {
    return fail("test_consecutive_error_frames", "a clean frame should reset the counter");
  }

  (void)checker.observe(make_frame("h9", 1.0, {{"BTN", 100.0}}));
  if (checker.consecutive_error_frames() != 1U || checker.should_trigger_emergency_stop(2)) {
    return fail("test_consecutive_error_frames", "violations should count as error frames");
  }

  checker.reset();
  if (checker.previous().has_value() || checker.consecutive_error_frames() != 0U) {
    return fail("test_consecutive_error_frames", "reset should clear all state");
  }
  return 0;
}

int test_frame_from_state_copies_table() {
  GameState state{};
  state.hand_id = "h7";
  state.on_street = street::TURN;
  state.pot = 42.0;
  state.stacks = {{"BTN", 10.0}, {"SB", 20.0}};
  state.confidence = 0.97;

  const auto frame = frame_from_state(state, {"stack SB occluded"});
  if (frame.hand_id != "h7" || frame.on_street != street::TURN || frame.pot != 42.0 || frame.stacks.size() != 2U ||
      frame.confidence != 0.97 || frame.parse_errors.size() != 1U) {
    return fail("test_frame_from_state_copies_table", "frame should mirror the game state");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_pot_decrease_is_flagged(); rc != 0) return rc;
  if (int rc = test_phantom_stack_increase_is_flagged(); rc != 0) return rc;
  if (int rc = test_conservation_catches_what_single_rules_miss(); rc != 0) return rc;
  if (int rc = test_betting_and_payout_sequences(); rc != 0) return rc;
  if (int rc = test_new_hand_resets_comparison(); rc != 0) return rc;
  if (int rc = test_tolerance_is_configurable(); rc != 0) return rc;
  if (int rc = test_seat_changes_are_not_counted(); rc != 0) return rc;
  if (int rc = test_confidence_drop_is_flagged(); rc != 0) return rc;
  if (int rc = test_consecutive_error_frames(); rc != 0) return rc;
  if (int rc = test_frame_from_state_copies_table(); rc != 0) return rc;

  std::cout << "[PASS] consistency unit tests\n";
  return 0;
}
