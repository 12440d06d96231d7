#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "model/game_state.hpp"

namespace decision_agent::replay {

// One recorded perception result.
struct ReplayFrame {
  model::GameState state{};
  std::vector<std::string> parse_errors{};
  // Outcome of executing the previous decision, when the recording has it.
  std::optional<bool> execution_succeeded{};
};

// Parses one JSON object. Throws std::runtime_error on malformed input.
//
// {"hand_id": "h1", "hero": "BTN", "street": "flop", "pot": 12.5,
//  "stacks": {"BTN": 100, "BB": 88}, "confidence": 0.998,
//  "legal_actions": [{"type": "check"}, {"type": "raise", "amount": 6}],
//  "parse_errors": [], "executed": true}
ReplayFrame parse_frame(const std::string& line);

// Reads JSON-lines input, skipping blank lines.
class FrameReader {
 public:
  explicit FrameReader(std::istream& input) : input_(input) {}

  // Empty at end of input. Errors carry the 1-based line number.
  std::optional<ReplayFrame> next();

  [[nodiscard]] std::size_t line_number() const noexcept { return line_number_; }

 private:
  std::istream& input_;
  std::size_t line_number_{0};
};

}  // namespace decision_agent::replay
