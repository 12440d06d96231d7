#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace decision_agent::model {

enum class action_type : std::uint8_t {
  FOLD = 0,
  CHECK = 1,
  CALL = 2,
  RAISE = 3,
};

inline constexpr action_type kAllActionTypes[] = {
    action_type::FOLD,
    action_type::CHECK,
    action_type::CALL,
    action_type::RAISE,
};

enum class street : std::uint8_t {
  PREFLOP = 0,
  FLOP = 1,
  TURN = 2,
  RIVER = 3,
};

const char* to_string(action_type type) noexcept;
const char* to_string(street value) noexcept;
std::optional<action_type> parse_action_type(const std::string& value);
std::optional<street> parse_street(const std::string& value);

struct Action {
  action_type type{action_type::FOLD};
  std::optional<double> amount{};
  std::string position{};
  street on_street{street::PREFLOP};
};

bool operator==(const Action& lhs, const Action& rhs);

// "raise:BTN:flop:12.5" style key, stable across runs.
std::string action_key(const Action& action);

struct GameState {
  std::string hand_id{};
  std::string hero{};
  street on_street{street::PREFLOP};
  double pot{0.0};
  std::map<std::string, double> stacks{};
  std::vector<Action> legal_actions{};
  double confidence{1.0};
};

}  // namespace decision_agent::model
