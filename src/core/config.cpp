#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace decision_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = lowercase(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

double parse_number(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  return parsed;
}

double parse_non_negative(const std::string& key, const std::string& value) {
  const double parsed = parse_number(key, value);
  if (parsed < 0.0) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }
  return parsed;
}

double parse_ratio(const std::string& key, const std::string& value) {
  const double parsed = parse_number(key, value);
  if (parsed < 0.0 || parsed > 1.0) {
    throw std::runtime_error(key + " must be in range 0..1");
  }
  return parsed;
}

std::uint32_t parse_count(const std::string& key, const std::string& value) {
  const double parsed = parse_number(key, value);
  if (parsed < 1.0 || parsed != static_cast<double>(static_cast<std::uint32_t>(parsed))) {
    throw std::runtime_error(key + " must be a positive integer");
  }
  return static_cast<std::uint32_t>(parsed);
}

log_level parse_log_level(const std::string& value) {
  const std::string lower = lowercase(value);
  if (lower == "debug") {
    return log_level::DEBUG;
  }
  if (lower == "info") {
    return log_level::INFO;
  }
  if (lower == "warn" || lower == "warning") {
    return log_level::WARN;
  }
  if (lower == "error") {
    return log_level::ERROR;
  }
  throw std::runtime_error("agent.log_level must be one of debug, info, warn, error");
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const double parsed_port = parse_number("redis.address port", value.substr(split + 1));
  if (parsed_port < 1.0 || parsed_port > 65535.0 ||
      parsed_port != static_cast<double>(static_cast<std::uint16_t>(parsed_port))) {
    throw std::runtime_error("redis.address port must be an integer in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(RuntimeConfig& config, const std::string& key, const std::string& value) {
  if (key == "session_id") {
    if (value.empty()) {
      throw std::runtime_error("session_id must not be empty");
    }
    config.session_id = value;
    return;
  }

  if (key == "budget.total_ms") {
    config.budget.total_ms = parse_number(key, value);
    if (config.budget.total_ms <= 0.0) {
      throw std::runtime_error("budget.total_ms must be greater than 0");
    }
    return;
  }

  if (key.rfind("budget.", 0) == 0 && key.size() > 3 && key.compare(key.size() - 3, 3, "_ms") == 0) {
    const std::string name = key.substr(std::string("budget.").size(), key.size() - std::string("budget.").size() - 3);
    const auto component = budget::parse_budget_component(name);
    if (!component.has_value()) {
      throw std::runtime_error("unknown budget component: " + name);
    }
    budget::at(config.budget.allocation, *component) = parse_non_negative(key, value);
    return;
  }

  if (key == "pipeline.gto_budget_ms") {
    config.pipeline.gto_budget_ms = parse_non_negative(key, value);
    return;
  }

  if (key == "pipeline.advisor_cap_ms") {
    config.pipeline.advisor_cap_ms = parse_non_negative(key, value);
    return;
  }

  if (key == "health.interval_ms") {
    const double interval = parse_number(key, value);
    if (interval < 10.0) {
      throw std::runtime_error("health.interval_ms must be at least 10");
    }
    config.health.interval = std::chrono::milliseconds(static_cast<std::int64_t>(interval));
    return;
  }

  if (key == "health.thresholds.vision_confidence_min") {
    config.health.thresholds.vision_confidence_min = parse_ratio(key, value);
    return;
  }

  if (key == "health.thresholds.solver_latency_ms") {
    config.health.thresholds.solver_latency_ms = parse_non_negative(key, value);
    return;
  }

  if (key == "health.thresholds.executor_failure_rate") {
    config.health.thresholds.executor_failure_rate = parse_ratio(key, value);
    return;
  }

  if (key == "health.thresholds.strategy_divergence_pp") {
    config.health.thresholds.strategy_divergence_pp = parse_non_negative(key, value);
    return;
  }

  if (key == "health.safe_mode.enabled") {
    config.health.safe_mode.enabled = parse_bool(value);
    return;
  }

  if (key == "health.safe_mode.auto_exit") {
    config.health.safe_mode.auto_exit = parse_bool(value);
    return;
  }

  if (key == "health.safe_mode.auto_exit_healthy_streak") {
    config.health.safe_mode.auto_exit_healthy_streak = parse_count(key, value);
    return;
  }

  if (key == "health.panic_stop.vision_confidence_frames") {
    config.health.panic_stop.vision_confidence_frames = parse_count(key, value);
    return;
  }

  if (key == "health.panic_stop.min_confidence") {
    config.health.panic_stop.min_confidence = parse_ratio(key, value);
    return;
  }

  if (key == "consistency.tolerance") {
    config.consistency.tolerance = parse_non_negative(key, value);
    return;
  }

  if (key == "consistency.confidence_drop") {
    config.consistency.confidence_drop = parse_ratio(key, value);
    return;
  }

  if (key == "consistency.emergency_stop_frames") {
    config.consistency.emergency_stop_frames = parse_count(key, value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "agent.log_level") {
    config.min_log_level = parse_log_level(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

}  // namespace

void validate_runtime_config(const RuntimeConfig& config) {
  const double allocated = budget::sum(config.budget.allocation);
  if (allocated > config.budget.total_ms) {
    std::ostringstream message;
    message << "budget allocations sum to " << allocated << "ms which exceeds budget.total_ms="
            << config.budget.total_ms;
    throw std::runtime_error(message.str());
  }
}

RuntimeConfig load_runtime_config(const std::string& path) {
  RuntimeConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_runtime_config(config);
  return config;
}

}  // namespace decision_agent::core
