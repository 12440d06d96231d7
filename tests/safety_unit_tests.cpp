#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "core/logger.hpp"
#include "health/metrics_store.hpp"
#include "health/monitor.hpp"
#include "model/decision.hpp"
#include "model/health.hpp"
#include "safety/panic_stop.hpp"
#include "safety/safe_mode.hpp"

using decision_agent::core::Logger;
using decision_agent::core::log_level;
using decision_agent::health::HealthMetricsStore;
using decision_agent::health::HealthMonitor;
using decision_agent::health::HealthMonitorConfig;
using decision_agent::health::HealthMonitorOptions;
using decision_agent::health::MetricsStoreOptions;
using decision_agent::model::HealthSnapshot;
using decision_agent::model::HealthStatus;
using decision_agent::model::PanicStopReason;
using decision_agent::model::SafeModeActive;
using decision_agent::model::StrategyDecision;
using decision_agent::model::compute_overall_health;
using decision_agent::model::health_state;
using decision_agent::model::panic_type;
using decision_agent::safety::PanicStopController;
using decision_agent::safety::SafeModeController;

namespace {

class CapturingLogger final : public Logger {
 public:
  void log(log_level level, const std::string& tag, const std::string& message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::string(decision_agent::core::to_string(level)) + " [" + tag + "] " + message);
  }

  bool contains(const std::string& fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
                       [&](const std::string& line) { return line.find(fragment) != std::string::npos; });
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
};

int fail(const char* name, const std::string& msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

PanicStopReason make_reason(panic_type type, const std::string& detail) {
  PanicStopReason reason{};
  reason.type = type;
  reason.detail = detail;
  reason.triggered_at_ms = 1;
  return reason;
}

HealthStatus make_status(const std::string& component, health_state state) {
  HealthStatus status{};
  status.component = component;
  status.state = state;
  return status;
}

std::string active_reason(const SafeModeController& safe_mode) {
  const auto state = safe_mode.state();
  const auto* active = std::get_if<SafeModeActive>(&state);
  return active != nullptr ? active->reason : std::string{};
}

int test_safe_mode_manual_latch() {
  SafeModeController safe_mode{};
  safe_mode.enter("operator", true);
  safe_mode.exit(false);
  if (!safe_mode.is_active()) {
    return fail("test_safe_mode_manual_latch", "automatic exit should not clear a manual latch");
  }
  safe_mode.exit(true);
  if (safe_mode.is_active()) {
    return fail("test_safe_mode_manual_latch", "manual exit should clear the latch");
  }

  safe_mode.enter("health:degraded");
  safe_mode.exit();
  if (safe_mode.is_active()) {
    return fail("test_safe_mode_manual_latch", "automatic latch should clear on automatic exit");
  }
  return 0;
}

int test_safe_mode_keeps_first_reason() {
  auto logger = std::make_shared<CapturingLogger>();
  SafeModeController safe_mode{logger};
  safe_mode.enter("first");
  safe_mode.enter("second", true);

  const auto state = safe_mode.state();
  const auto* active = std::get_if<SafeModeActive>(&state);
  if (active == nullptr || active->reason != "first" || active->manual || active->entered_at_ms == 0) {
    return fail("test_safe_mode_keeps_first_reason", "first enter should win");
  }
  if (!logger->contains("warn [safe-mode] entered: first")) {
    return fail("test_safe_mode_keeps_first_reason", "enter should be logged at warn");
  }
  safe_mode.exit();
  if (!logger->contains("info [safe-mode] exited")) {
    return fail("test_safe_mode_keeps_first_reason", "exit should be logged at info");
  }
  return 0;
}

int test_panic_trigger_is_idempotent() {
  auto safe_mode = std::make_shared<SafeModeController>();
  PanicStopController panic{safe_mode};

  panic.trigger(make_reason(panic_type::RISK_LIMIT, "bankroll drawdown"));
  panic.trigger(make_reason(panic_type::MANUAL, "operator"));

  const auto reason = panic.reason();
  if (!panic.is_active() || !reason.has_value()) {
    return fail("test_panic_trigger_is_idempotent", "panic should be active");
  }
  if (reason->detail != "bankroll drawdown" || reason->type != panic_type::RISK_LIMIT) {
    return fail("test_panic_trigger_is_idempotent", "first reason should be retained");
  }
  if (active_reason(*safe_mode) != "panic:risk_limit") {
    return fail("test_panic_trigger_is_idempotent", "panic should enter safe mode with its type");
  }
  return 0;
}

int test_panic_reset_leaves_safe_mode() {
  auto safe_mode = std::make_shared<SafeModeController>();
  PanicStopController panic{safe_mode};

  panic.trigger(make_reason(panic_type::VISION_CONFIDENCE, "low confidence"));
  panic.reset();
  if (panic.is_active() || panic.reason().has_value()) {
    return fail("test_panic_reset_leaves_safe_mode", "reset should clear the panic");
  }
  if (!safe_mode->is_active()) {
    return fail("test_panic_reset_leaves_safe_mode", "reset should not exit safe mode");
  }

  safe_mode->exit();
  if (safe_mode->is_active()) {
    return fail("test_panic_reset_leaves_safe_mode", "panic safe mode should be an automatic latch");
  }

  panic.trigger(make_reason(panic_type::MANUAL, "again"));
  if (!panic.is_active() || panic.reason()->detail != "again") {
    return fail("test_panic_reset_leaves_safe_mode", "a reset panic should accept a new reason");
  }
  return 0;
}

int test_overall_health_is_worst_state() {
  const std::vector<std::pair<std::vector<health_state>, health_state>> cases = {
      {{health_state::HEALTHY, health_state::HEALTHY, health_state::DEGRADED, health_state::FAILED},
       health_state::FAILED},
      {{health_state::HEALTHY, health_state::DEGRADED, health_state::DEGRADED}, health_state::DEGRADED},
      {{health_state::HEALTHY, health_state::HEALTHY}, health_state::HEALTHY},
      {{health_state::FAILED, health_state::FAILED}, health_state::FAILED},
  };

  for (const auto& [states, expected] : cases) {
    auto permutation = states;
    std::sort(permutation.begin(), permutation.end());
    do {
      std::vector<HealthStatus> statuses;
      for (const auto state : permutation) {
        statuses.push_back(make_status("c", state));
      }
      if (compute_overall_health(statuses) != expected) {
        return fail("test_overall_health_is_worst_state", "unexpected aggregate for a permutation");
      }
    } while (std::next_permutation(permutation.begin(), permutation.end()));
  }

  if (compute_overall_health({}) != health_state::HEALTHY) {
    return fail("test_overall_health_is_worst_state", "no statuses should be healthy");
  }
  return 0;
}

struct FakeWallClock {
  std::atomic<std::uint64_t> now_ms{100'000};
};

HealthMetricsStore make_store(const std::shared_ptr<FakeWallClock>& clock,
                              std::shared_ptr<decision_agent::safety::PanicTrigger> panic = {}) {
  MetricsStoreOptions options{};
  options.now_ms = [clock]() { return clock->now_ms.load(); };
  return HealthMetricsStore{options, std::move(panic)};
}

int test_vision_status_rules() {
  auto clock = std::make_shared<FakeWallClock>();
  auto store = make_store(clock);

  auto status = store.build_vision_status(0.99);
  if (status.state != health_state::FAILED || status.details != std::optional<std::string>("stale vision feed")) {
    return fail("test_vision_status_rules", "no samples should read as a stale feed");
  }

  store.record_vision_sample(0.995, clock->now_ms.load());
  status = store.build_vision_status(0.99);
  if (status.state != health_state::HEALTHY || status.consecutive_failures != 0 || status.component != "vision") {
    return fail("test_vision_status_rules", "fresh confident sample should be healthy");
  }

  store.record_vision_sample(0.5, clock->now_ms.load());
  status = store.build_vision_status(0.99);
  if (status.state != health_state::DEGRADED || status.details != std::optional<std::string>("confidence 0.500 < 0.990")) {
    return fail("test_vision_status_rules", "low confidence should degrade");
  }
  if (status.metrics.at("confidence") != 0.5 || status.metrics.at("low_confidence_streak") != 1.0) {
    return fail("test_vision_status_rules", "vision metrics mismatch");
  }
  status = store.build_vision_status(0.99);
  if (status.consecutive_failures != 2) {
    return fail("test_vision_status_rules", "failures should accumulate across checks");
  }

  clock->now_ms += 15'001;
  status = store.build_vision_status(0.1);
  if (status.state != health_state::FAILED) {
    return fail("test_vision_status_rules", "feed older than 15s should fail");
  }
  return 0;
}

int test_solver_status_rules() {
  auto clock = std::make_shared<FakeWallClock>();
  auto store = make_store(clock);

  store.record_solver_sample(120.0, true, clock->now_ms.load());
  auto status = store.build_solver_status(800.0);
  if (status.state != health_state::DEGRADED || status.details != std::optional<std::string>("recent solver timeout")) {
    return fail("test_solver_status_rules", "timeout since last check should degrade");
  }
  if (status.metrics.at("timed_out_samples") != 1.0) {
    return fail("test_solver_status_rules", "timed out samples should be reported");
  }

  status = store.build_solver_status(800.0);
  if (status.state != health_state::HEALTHY || status.consecutive_failures != 0) {
    return fail("test_solver_status_rules", "timeout counter should reset after a check");
  }

  store.record_solver_sample(950.0, false, clock->now_ms.load());
  status = store.build_solver_status(800.0);
  if (status.state != health_state::DEGRADED ||
      status.details != std::optional<std::string>("latency 950.0ms > 800.0ms")) {
    return fail("test_solver_status_rules", "slow solver should degrade");
  }

  clock->now_ms += 30'001;
  status = store.build_solver_status(800.0);
  if (status.state != health_state::DEGRADED || status.details != std::optional<std::string>("solver stats stale")) {
    return fail("test_solver_status_rules", "old solver stats should degrade");
  }
  return 0;
}

int test_executor_status_rules() {
  auto clock = std::make_shared<FakeWallClock>();
  auto store = make_store(clock);

  auto status = store.build_executor_status(0.2);
  if (status.state != health_state::DEGRADED || status.details != std::optional<std::string>("executor idle")) {
    return fail("test_executor_status_rules", "executor without samples should be idle");
  }

  for (int i = 0; i < 10; ++i) {
    store.record_executor_sample(i >= 3, clock->now_ms.load());
  }
  status = store.build_executor_status(0.2);
  if (status.state != health_state::DEGRADED ||
      status.details != std::optional<std::string>("failure rate 30.0% > 20.0%")) {
    return fail("test_executor_status_rules", "30% failures should degrade");
  }

  for (int i = 0; i < 200; ++i) {
    store.record_executor_sample(true, clock->now_ms.load());
  }
  status = store.build_executor_status(0.2);
  if (status.state != health_state::HEALTHY || status.consecutive_failures != 0) {
    return fail("test_executor_status_rules", "diluted failures should recover");
  }

  // History was capped at 100 samples holding 3 failures; 40 more make 43 / 140.
  for (int i = 0; i < 40; ++i) {
    store.record_executor_sample(false, clock->now_ms.load());
  }
  status = store.build_executor_status(0.2);
  const double expected = 43.0 / 140.0;
  if (std::abs(status.metrics.at("failure_rate") - expected) > 1e-3) {
    return fail("test_executor_status_rules", "failure rate should use capped history");
  }
  return 0;
}

int test_strategy_status_rules() {
  auto clock = std::make_shared<FakeWallClock>();
  auto store = make_store(clock);

  StrategyDecision decision{};
  decision.reasoning.divergence_pp = 12.0;
  store.record_strategy_sample(decision, clock->now_ms.load());
  if (store.build_strategy_status(30.0).state != health_state::HEALTHY) {
    return fail("test_strategy_status_rules", "low divergence should be healthy");
  }

  decision.reasoning.divergence_pp = 45.0;
  store.record_strategy_sample(decision, clock->now_ms.load());
  auto status = store.build_strategy_status(30.0);
  if (status.state != health_state::DEGRADED || status.details != std::optional<std::string>("divergence 45.0pp")) {
    return fail("test_strategy_status_rules", "high divergence should degrade");
  }

  decision.reasoning.divergence_pp = 5.0;
  decision.reasoning.fallback_reason = "solver_fallback";
  store.record_strategy_sample(decision, clock->now_ms.load());
  status = store.build_strategy_status(30.0);
  if (status.state != health_state::DEGRADED || status.details != std::optional<std::string>("recent fallback")) {
    return fail("test_strategy_status_rules", "fallback since last check should degrade");
  }
  if (store.build_strategy_status(30.0).state != health_state::HEALTHY) {
    return fail("test_strategy_status_rules", "fallback counter should reset after a check");
  }

  clock->now_ms += 60'001;
  if (store.build_strategy_status(30.0).details != std::optional<std::string>("strategy stats stale")) {
    return fail("test_strategy_status_rules", "old strategy stats should degrade");
  }
  return 0;
}

int test_vision_streak_triggers_panic_end_to_end() {
  auto clock = std::make_shared<FakeWallClock>();
  auto safe_mode = std::make_shared<SafeModeController>();
  auto panic = std::make_shared<PanicStopController>(safe_mode);
  auto store = make_store(clock, panic);

  store.record_vision_sample(0.5, clock->now_ms.load());
  store.record_vision_sample(0.4, clock->now_ms.load());
  if (panic->is_active()) {
    return fail("test_vision_streak_triggers_panic_end_to_end", "two frames should not trip the panic");
  }
  store.record_vision_sample(0.3, clock->now_ms.load());

  const auto reason = panic->reason();
  if (!reason.has_value() || reason->type != panic_type::VISION_CONFIDENCE) {
    return fail("test_vision_streak_triggers_panic_end_to_end", "third low frame should trip vision panic");
  }
  if (reason->detail != "Vision confidence 0.300 below 0.990") {
    return fail("test_vision_streak_triggers_panic_end_to_end", "unexpected detail: " + reason->detail);
  }
  if (!safe_mode->is_active() || active_reason(*safe_mode) != "panic:vision_confidence") {
    return fail("test_vision_streak_triggers_panic_end_to_end", "safe mode should be entered as a side effect");
  }
  return 0;
}

int test_confident_frame_resets_streak() {
  auto clock = std::make_shared<FakeWallClock>();
  auto panic = std::make_shared<PanicStopController>(std::make_shared<SafeModeController>());
  auto store = make_store(clock, panic);

  store.record_vision_sample(0.5, clock->now_ms.load());
  store.record_vision_sample(0.4, clock->now_ms.load());
  store.record_vision_sample(0.999, clock->now_ms.load());
  store.record_vision_sample(0.3, clock->now_ms.load());
  store.record_vision_sample(0.3, clock->now_ms.load());
  if (panic->is_active()) {
    return fail("test_confident_frame_resets_streak", "streak should restart after a confident frame");
  }
  return 0;
}

HealthMonitorConfig monitor_config() {
  HealthMonitorConfig config{};
  config.interval = std::chrono::milliseconds(10);
  return config;
}

int test_monitor_without_checks_is_healthy() {
  HealthMonitor monitor{monitor_config()};
  const auto snapshot = monitor.run_checks();
  if (snapshot.overall != health_state::HEALTHY || !snapshot.statuses.empty()) {
    return fail("test_monitor_without_checks_is_healthy", "empty monitor should report healthy");
  }
  if (snapshot.id.empty() || snapshot.issued_at_ms == 0) {
    return fail("test_monitor_without_checks_is_healthy", "snapshot should carry id and timestamp");
  }
  return 0;
}

int test_monitor_converts_throwing_check() {
  auto logger = std::make_shared<CapturingLogger>();
  auto safe_mode = std::make_shared<SafeModeController>(logger);

  HealthMonitorOptions options{};
  options.logger = logger;
  options.safe_mode = safe_mode;
  HealthMonitor monitor{monitor_config(), options};
  monitor.register_check("ok-check", []() { return make_status("ok-check", health_state::HEALTHY); });
  monitor.register_check("boom-check", []() -> HealthStatus { throw std::runtime_error("kaboom"); });

  const auto snapshot = monitor.run_checks();
  if (snapshot.statuses.size() != 2U) {
    return fail("test_monitor_converts_throwing_check", "every check should produce a status");
  }
  const auto& failed = snapshot.statuses[1];
  if (failed.component != "boom-check" || failed.state != health_state::FAILED ||
      failed.consecutive_failures != 1 || failed.details != std::optional<std::string>("kaboom")) {
    return fail("test_monitor_converts_throwing_check", "throwing check should become a failed status");
  }
  if (snapshot.overall != health_state::FAILED) {
    return fail("test_monitor_converts_throwing_check", "overall should be failed");
  }
  if (!logger->contains("error [health] health check failed: boom-check: kaboom")) {
    return fail("test_monitor_converts_throwing_check", "check failure should be logged at error");
  }
  if (active_reason(*safe_mode) != "health:failed") {
    return fail("test_monitor_converts_throwing_check", "failed tick should enter safe mode");
  }
  return 0;
}

int test_monitor_auto_exit_after_two_healthy_ticks() {
  auto safe_mode = std::make_shared<SafeModeController>();
  auto state = std::make_shared<std::atomic<health_state>>(health_state::DEGRADED);

  HealthMonitorOptions options{};
  options.safe_mode = safe_mode;
  HealthMonitor monitor{monitor_config(), options};
  monitor.register_check("flaky", [state]() { return make_status("flaky", state->load()); });

  monitor.run_checks();
  if (active_reason(*safe_mode) != "health:degraded" || monitor.degraded_streak() != 1) {
    return fail("test_monitor_auto_exit_after_two_healthy_ticks", "degraded tick should enter safe mode");
  }

  state->store(health_state::HEALTHY);
  monitor.run_checks();
  if (!safe_mode->is_active()) {
    return fail("test_monitor_auto_exit_after_two_healthy_ticks", "one healthy tick is not enough");
  }
  monitor.run_checks();
  if (safe_mode->is_active() || monitor.healthy_streak() != 2) {
    return fail("test_monitor_auto_exit_after_two_healthy_ticks", "second healthy tick should exit safe mode");
  }
  return 0;
}

int test_monitor_respects_manual_and_panic_latches() {
  auto safe_mode = std::make_shared<SafeModeController>();
  auto panic = std::make_shared<PanicStopController>(safe_mode);

  HealthMonitorOptions options{};
  options.safe_mode = safe_mode;
  options.panic_stop = panic;
  HealthMonitor monitor{monitor_config(), options};
  monitor.register_check("steady", []() { return make_status("steady", health_state::HEALTHY); });

  safe_mode->enter("operator", true);
  monitor.run_checks();
  monitor.run_checks();
  monitor.run_checks();
  if (!safe_mode->is_active()) {
    return fail("test_monitor_respects_manual_and_panic_latches", "manual safe mode must not auto-exit");
  }
  safe_mode->exit(true);

  panic->trigger(make_reason(panic_type::RISK_LIMIT, "limit"));
  monitor.run_checks();
  const auto snapshot = monitor.run_checks();
  if (!safe_mode->is_active()) {
    return fail("test_monitor_respects_manual_and_panic_latches", "latched panic should hold safe mode");
  }
  if (!snapshot.panic_stop.has_value() || snapshot.panic_stop->detail != "limit") {
    return fail("test_monitor_respects_manual_and_panic_latches", "snapshot should carry the panic reason");
  }
  if (!std::holds_alternative<SafeModeActive>(snapshot.safe_mode)) {
    return fail("test_monitor_respects_manual_and_panic_latches", "snapshot should carry safe mode state");
  }

  panic->reset();
  monitor.run_checks();
  if (safe_mode->is_active()) {
    return fail("test_monitor_respects_manual_and_panic_latches", "healthy ticks should exit after panic reset");
  }
  return 0;
}

int test_monitor_does_not_override_panic_reason() {
  auto safe_mode = std::make_shared<SafeModeController>();
  auto panic = std::make_shared<PanicStopController>(nullptr);
  panic->trigger(make_reason(panic_type::MANUAL, "operator stop"));

  HealthMonitorOptions options{};
  options.safe_mode = safe_mode;
  options.panic_stop = panic;
  HealthMonitor monitor{monitor_config(), options};
  monitor.register_check("bad", []() { return make_status("bad", health_state::DEGRADED); });

  monitor.run_checks();
  if (safe_mode->is_active()) {
    return fail("test_monitor_does_not_override_panic_reason", "monitor should leave safe mode to the panic");
  }
  return 0;
}

int test_monitor_disabled_safe_mode() {
  auto safe_mode = std::make_shared<SafeModeController>();
  auto config = monitor_config();
  config.safe_mode_enabled = false;

  HealthMonitorOptions options{};
  options.safe_mode = safe_mode;
  HealthMonitor monitor{config, options};
  monitor.register_check("bad", []() { return make_status("bad", health_state::FAILED); });

  monitor.run_checks();
  if (safe_mode->is_active()) {
    return fail("test_monitor_disabled_safe_mode", "disabled safe mode should not be entered");
  }

  config.safe_mode_enabled = true;
  config.auto_exit = false;
  HealthMonitor sticky{config, options};
  auto healthy = std::make_shared<std::atomic<bool>>(false);
  sticky.register_check("flip", [healthy]() {
    return make_status("flip", healthy->load() ? health_state::HEALTHY : health_state::FAILED);
  });
  sticky.run_checks();
  healthy->store(true);
  sticky.run_checks();
  sticky.run_checks();
  sticky.run_checks();
  if (!safe_mode->is_active()) {
    return fail("test_monitor_disabled_safe_mode", "auto exit disabled should keep safe mode");
  }
  return 0;
}

int test_monitor_background_ticks() {
  auto snapshots = std::make_shared<std::atomic<int>>(0);
  auto ids = std::make_shared<std::set<std::string>>();
  auto ids_mutex = std::make_shared<std::mutex>();

  HealthMonitorOptions options{};
  options.on_snapshot = [snapshots, ids, ids_mutex](const HealthSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(*ids_mutex);
    ids->insert(snapshot.id);
    snapshots->fetch_add(1);
  };
  HealthMonitor monitor{monitor_config(), options};
  monitor.register_check("steady", []() { return make_status("steady", health_state::HEALTHY); });

  monitor.start();
  if (!monitor.latest_snapshot().has_value() || snapshots->load() < 1) {
    return fail("test_monitor_background_ticks", "start should tick immediately");
  }
  monitor.start();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (snapshots->load() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  monitor.stop();
  monitor.stop();

  if (monitor.running()) {
    return fail("test_monitor_background_ticks", "stop should halt the worker");
  }
  if (snapshots->load() < 3) {
    return fail("test_monitor_background_ticks", "worker should tick on the interval");
  }
  const int after_stop = snapshots->load();
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  if (snapshots->load() != after_stop) {
    return fail("test_monitor_background_ticks", "no ticks expected after stop");
  }

  std::lock_guard<std::mutex> lock(*ids_mutex);
  if (ids->size() != static_cast<std::size_t>(after_stop)) {
    return fail("test_monitor_background_ticks", "snapshot ids should be unique");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_safe_mode_manual_latch(); rc != 0) return rc;
  if (int rc = test_safe_mode_keeps_first_reason(); rc != 0) return rc;
  if (int rc = test_panic_trigger_is_idempotent(); rc != 0) return rc;
  if (int rc = test_panic_reset_leaves_safe_mode(); rc != 0) return rc;
  if (int rc = test_overall_health_is_worst_state(); rc != 0) return rc;
  if (int rc = test_vision_status_rules(); rc != 0) return rc;
  if (int rc = test_solver_status_rules(); rc != 0) return rc;
  if (int rc = test_executor_status_rules(); rc != 0) return rc;
  if (int rc = test_strategy_status_rules(); rc != 0) return rc;
  if (int rc = test_vision_streak_triggers_panic_end_to_end(); rc != 0) return rc;
  if (int rc = test_confident_frame_resets_streak(); rc != 0) return rc;
  if (int rc = test_monitor_without_checks_is_healthy(); rc != 0) return rc;
  if (int rc = test_monitor_converts_throwing_check(); rc != 0) return rc;
  if (int rc = test_monitor_auto_exit_after_two_healthy_ticks(); rc != 0) return rc;
  if (int rc = test_monitor_respects_manual_and_panic_latches(); rc != 0) return rc;
  if (int rc = test_monitor_does_not_override_panic_reason(); rc != 0) return rc;
  if (int rc = test_monitor_disabled_safe_mode(); rc != 0) return rc;
  if (int rc = test_monitor_background_ticks(); rc != 0) return rc;

  std::cout << "[PASS] safety unit tests\n";
  return 0;
}
