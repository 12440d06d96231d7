#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "model/game_state.hpp"

namespace decision_agent::consistency {

// One parsed observation of the table.
struct ConsistencyFrame {
  std::string hand_id{};
  model::street on_street{model::street::PREFLOP};
  double pot{0.0};
  std::map<std::string, double> stacks{};
  double confidence{1.0};
  std::vector<std::string> parse_errors{};
};

ConsistencyFrame frame_from_state(const model::GameState& state, std::vector<std::string> parse_errors = {});

struct ConsistencyOptions {
  // Absorbs floating-point rounding in chip arithmetic only.
  double tolerance{0.01};
  double max_confidence_drop{0.3};
};

// Compares each frame with the previous frame of the same hand and reports
// contradictions as readable strings. A new hand id is the only point where
// pot and stacks may legitimately reset.
class StateConsistencyChecker {
 public:
  explicit StateConsistencyChecker(ConsistencyOptions options = {});

  // Checks `frame` against the retained one, then retains `frame`.
  std::vector<std::string> observe(const ConsistencyFrame& frame);

  // Most recent frames in a row carrying violations or parse errors.
  [[nodiscard]] std::uint32_t consecutive_error_frames() const noexcept { return consecutive_error_frames_; }
  [[nodiscard]] bool should_trigger_emergency_stop(std::uint32_t threshold = 5) const noexcept;

  [[nodiscard]] const std::optional<ConsistencyFrame>& previous() const noexcept { return previous_; }
  void reset() noexcept;

 private:
  std::vector<std::string> compare(const ConsistencyFrame& previous, const ConsistencyFrame& current) const;

  ConsistencyOptions options_;
  std::optional<ConsistencyFrame> previous_{};
  std::uint32_t consecutive_error_frames_{0};
};

}  // namespace decision_agent::consistency
