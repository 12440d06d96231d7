#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "budget/time_budget_tracker.hpp"
#include "core/logger.hpp"

namespace decision_agent::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"decision:agent"};
  bool enabled{false};
};

struct BudgetConfig {
  double total_ms{budget::kDefaultTotalBudgetMs};
  budget::BudgetAllocation allocation{budget::kDefaultBudgetAllocation};
};

struct PipelineConfig {
  double gto_budget_ms{400.0};
  double advisor_cap_ms{200.0};
};

struct HealthThresholds {
  double vision_confidence_min{0.99};
  double solver_latency_ms{800.0};
  double executor_failure_rate{0.2};
  double strategy_divergence_pp{30.0};
};

struct SafeModeConfig {
  bool enabled{true};
  bool auto_exit{true};
  std::uint32_t auto_exit_healthy_streak{2};
};

struct PanicStopConfig {
  std::uint32_t vision_confidence_frames{3};
  double min_confidence{0.99};
};

struct HealthConfig {
  std::chrono::milliseconds interval{1000};
  HealthThresholds thresholds{};
  SafeModeConfig safe_mode{};
  PanicStopConfig panic_stop{};
};

struct ConsistencyConfig {
  double tolerance{0.01};
  double confidence_drop{0.3};
  std::uint32_t emergency_stop_frames{5};
};

struct RuntimeConfig {
  std::string session_id{"local"};
  BudgetConfig budget{};
  PipelineConfig pipeline{};
  HealthConfig health{};
  ConsistencyConfig consistency{};
  log_level min_log_level{log_level::INFO};
  bool stdout_debug{true};
  RedisConfig redis{};
};

// Indentation-scoped "key: value" subset of YAML; nested keys are joined
// with dots. Throws std::runtime_error on unreadable files or bad values.
RuntimeConfig load_runtime_config(const std::string& path);

// Cross-field checks (allocations must fit the total budget).
void validate_runtime_config(const RuntimeConfig& config);

}  // namespace decision_agent::core
