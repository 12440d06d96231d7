#include "replay/frame_reader.hpp"

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace decision_agent::replay {
namespace {

using nlohmann::json;

const json& require(const json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end()) {
    throw std::runtime_error(std::string("frame is missing \"") + key + "\"");
  }
  return *it;
}

model::street read_street(const json& value) {
  const auto parsed = model::parse_street(value.get<std::string>());
  if (!parsed.has_value()) {
    throw std::runtime_error("unknown street: " + value.get<std::string>());
  }
  return *parsed;
}

model::Action read_action(const json& value, const model::GameState& state) {
  if (!value.is_object()) {
    throw std::runtime_error("legal action must be an object");
  }

  const std::string type_name = require(value, "type").get<std::string>();
  const auto type = model::parse_action_type(type_name);
  if (!type.has_value()) {
    throw std::runtime_error("unknown action type: " + type_name);
  }

  model::Action action{};
  action.type = *type;
  action.position = value.value("position", state.hero);
  action.on_street = value.contains("street") ? read_street(value.at("street")) : state.on_street;
  if (value.contains("amount") && !value.at("amount").is_null()) {
    action.amount = value.at("amount").get<double>();
  }
  return action;
}

}  // namespace

ReplayFrame parse_frame(const std::string& line) {
  json document;
  try {
    document = json::parse(line);
  } catch (const json::parse_error& error) {
    throw std::runtime_error(std::string("invalid JSON: ") + error.what());
  }
  if (!document.is_object()) {
    throw std::runtime_error("frame must be a JSON object");
  }

  ReplayFrame frame{};
  auto& state = frame.state;
  try {
    state.hand_id = require(document, "hand_id").get<std::string>();
    state.hero = require(document, "hero").get<std::string>();
    state.on_street = read_street(require(document, "street"));
    state.pot = require(document, "pot").get<double>();
    state.confidence = document.value("confidence", 1.0);

    for (const auto& [position, stack] : require(document, "stacks").items()) {
      state.stacks[position] = stack.get<double>();
    }
    if (document.contains("legal_actions")) {
      for (const auto& action : document.at("legal_actions")) {
        state.legal_actions.push_back(read_action(action, state));
      }
    }
    if (document.contains("parse_errors")) {
      frame.parse_errors = document.at("parse_errors").get<std::vector<std::string>>();
    }
    if (document.contains("executed") && !document.at("executed").is_null()) {
      frame.execution_succeeded = document.at("executed").get<bool>();
    }
  } catch (const json::exception& error) {
    throw std::runtime_error(std::string("bad frame field: ") + error.what());
  }

  if (state.hand_id.empty()) {
    throw std::runtime_error("hand_id must not be empty");
  }
  if (state.confidence < 0.0 || state.confidence > 1.0) {
    throw std::runtime_error("confidence must be in range 0..1");
  }
  return frame;
}

std::optional<ReplayFrame> FrameReader::next() {
  std::string line;
  while (std::getline(input_, line)) {
    ++line_number_;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    try {
      return parse_frame(line);
    } catch (const std::runtime_error& error) {
      throw std::runtime_error("line " + std::to_string(line_number_) + ": " + error.what());
    }
  }
  return std::nullopt;
}

}  // namespace decision_agent::replay
