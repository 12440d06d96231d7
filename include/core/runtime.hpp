#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "budget/time_budget_tracker.hpp"
#include "consistency/state_consistency.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "decision/collaborators.hpp"
#include "decision/pipeline.hpp"
#include "health/metrics_store.hpp"
#include "health/monitor.hpp"
#include "model/game_state.hpp"
#include "model/health.hpp"
#include "safety/panic_stop.hpp"
#include "safety/safe_mode.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace decision_agent::core {

struct RuntimeCollaborators {
  std::shared_ptr<decision::Solver> solver{};
  std::shared_ptr<decision::StrategyEngine> strategy_engine{};
  // Optional; without it every cycle runs solver-only.
  std::shared_ptr<decision::AdvisorEnsemble> advisors{};
};

struct RuntimeOptions {
  std::shared_ptr<Logger> logger{};
  // Unix milliseconds for telemetry timestamps; system_clock when empty.
  std::function<std::uint64_t()> now_ms{};
  // Monotonic milliseconds for the budget tracker; steady_clock when empty.
  std::function<double()> monotonic_ms{};
};

struct CycleOutcome {
  decision::DecisionPipelineResult result{};
  std::vector<std::string> violations{};
  // False when safe mode or a panic stop forbids acting on the decision.
  bool actionable{true};
};

struct RuntimeStats {
  std::uint64_t cycles{0};
  std::uint64_t solver_timeouts{0};
  std::uint64_t consistency_violations{0};
  std::uint64_t blocked_decisions{0};
  std::uint64_t sink_errors{0};
};

// The decision-cycle caller: perception checks, one budgeted pipeline run,
// telemetry, and the safety gate, plus the periodic health monitor.
//
// run_cycle() is meant for one thread. The monitor ticks on its own thread
// and only touches the shared safety objects and the metrics store.
class DecisionRuntime {
 public:
  DecisionRuntime(RuntimeConfig config, RuntimeCollaborators collaborators, RuntimeOptions options = {});
  ~DecisionRuntime();

  DecisionRuntime(const DecisionRuntime&) = delete;
  DecisionRuntime& operator=(const DecisionRuntime&) = delete;

  void start_monitoring();
  void stop_monitoring();

  CycleOutcome run_cycle(const model::GameState& state, const std::vector<std::string>& parse_errors = {});
  void record_execution(bool success);

  // One monitor tick on the calling thread.
  model::HealthSnapshot check_health();

  [[nodiscard]] RuntimeStats stats() const;
  [[nodiscard]] const RuntimeConfig& config() const noexcept { return config_; }
  [[nodiscard]] safety::SafeModeController& safe_mode() noexcept { return *safe_mode_; }
  [[nodiscard]] safety::PanicStopController& panic_stop() noexcept { return *panic_stop_; }
  [[nodiscard]] health::HealthMetricsStore& metrics() noexcept { return *metrics_; }
  [[nodiscard]] health::HealthMonitor& monitor() noexcept { return *monitor_; }
  [[nodiscard]] const budget::TimeBudgetTracker& tracker() const noexcept { return *tracker_; }

 private:
  std::uint64_t now_ms() const;
  void check_consistency(const model::GameState& state, const std::vector<std::string>& parse_errors,
                         CycleOutcome& outcome);
  void apply_safety_gate(CycleOutcome& outcome);
  void publish_snapshot(const model::HealthSnapshot& snapshot);

  RuntimeConfig config_;
  RuntimeOptions options_;
  std::shared_ptr<Logger> logger_;

  std::shared_ptr<safety::SafeModeController> safe_mode_;
  std::shared_ptr<safety::PanicStopController> panic_stop_;
  std::shared_ptr<health::HealthMetricsStore> metrics_;
  std::shared_ptr<budget::TimeBudgetTracker> tracker_;
  decision::DecisionPipelineDeps pipeline_deps_{};
  consistency::StateConsistencyChecker consistency_;

  std::unique_ptr<sinks::StdoutDebugSink> stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  std::unique_ptr<health::HealthMonitor> monitor_{};

  mutable std::mutex stats_mutex_;
  RuntimeStats stats_{};
  budget::BudgetAllocation last_consumed_{};
};

}  // namespace decision_agent::core
