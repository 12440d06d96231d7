#include "model/game_state.hpp"

#include <sstream>

namespace decision_agent::model {

const char* to_string(const action_type type) noexcept {
  switch (type) {
    case action_type::FOLD:
      return "fold";
    case action_type::CHECK:
      return "check";
    case action_type::CALL:
      return "call";
    case action_type::RAISE:
      return "raise";
  }
  return "fold";
}

const char* to_string(const street value) noexcept {
  switch (value) {
    case street::PREFLOP:
      return "preflop";
    case street::FLOP:
      return "flop";
    case street::TURN:
      return "turn";
    case street::RIVER:
      return "river";
  }
  return "preflop";
}

std::optional<action_type> parse_action_type(const std::string& value) {
  for (const auto type : kAllActionTypes) {
    if (value == to_string(type)) {
      return type;
    }
  }
  return std::nullopt;
}

std::optional<street> parse_street(const std::string& value) {
  for (const auto candidate : {street::PREFLOP, street::FLOP, street::TURN, street::RIVER}) {
    if (value == to_string(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

bool operator==(const Action& lhs, const Action& rhs) {
  return lhs.type == rhs.type && lhs.amount == rhs.amount && lhs.position == rhs.position &&
         lhs.on_street == rhs.on_street;
}

std::string action_key(const Action& action) {
  std::ostringstream key;
  key << to_string(action.type) << ':' << action.position << ':' << to_string(action.on_street);
  if (action.amount.has_value()) {
    key << ':' << *action.amount;
  }
  return key.str();
}

}  // namespace decision_agent::model
