#include "core/runtime.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/timestamp.hpp"

namespace decision_agent::core {
namespace {

constexpr const char* kTag = "runtime";

std::string join_violations(const std::vector<std::string>& violations) {
  std::ostringstream out;
  for (std::size_t i = 0; i < violations.size(); ++i) {
    if (i > 0) {
      out << "; ";
    }
    out << violations[i];
  }
  return out.str();
}

std::string describe_redis(const RedisConfig& redis) {
  if (!redis.unix_socket.empty()) {
    return "unix://" + redis.unix_socket;
  }
  return redis.host + ':' + std::to_string(redis.port);
}

}  // namespace

DecisionRuntime::DecisionRuntime(RuntimeConfig config, RuntimeCollaborators collaborators, RuntimeOptions options)
    : config_(std::move(config)),
      options_(std::move(options)),
      logger_(options_.logger != nullptr ? options_.logger : make_stderr_logger(config_.min_log_level)),
      consistency_(consistency::ConsistencyOptions{config_.consistency.tolerance, config_.consistency.confidence_drop}) {
  if (collaborators.solver == nullptr || collaborators.strategy_engine == nullptr) {
    throw std::invalid_argument("decision runtime requires a solver and a strategy engine");
  }
  validate_runtime_config(config_);

  safe_mode_ = std::make_shared<safety::SafeModeController>(logger_);
  panic_stop_ = std::make_shared<safety::PanicStopController>(safe_mode_, logger_);

  health::MetricsStoreOptions metrics_options{};
  metrics_options.panic.vision_confidence_frames = config_.health.panic_stop.vision_confidence_frames;
  metrics_options.panic.min_confidence = config_.health.panic_stop.min_confidence;
  metrics_options.now_ms = [this]() { return now_ms(); };
  metrics_ = std::make_shared<health::HealthMetricsStore>(metrics_options, panic_stop_);

  budget::TimeBudgetTrackerOptions tracker_options{};
  tracker_options.total_budget_ms = config_.budget.total_ms;
  tracker_options.allocation = config_.budget.allocation;
  tracker_options.now = options_.monotonic_ms;
  tracker_options.logger = logger_;
  tracker_ = std::make_shared<budget::TimeBudgetTracker>(tracker_options);

  pipeline_deps_.strategy_engine = std::move(collaborators.strategy_engine);
  pipeline_deps_.solver = std::move(collaborators.solver);
  pipeline_deps_.advisors = std::move(collaborators.advisors);
  pipeline_deps_.tracker = tracker_;
  pipeline_deps_.gto_budget_ms = config_.pipeline.gto_budget_ms;
  pipeline_deps_.advisor_cap_ms = config_.pipeline.advisor_cap_ms;
  pipeline_deps_.logger = logger_;

  if (config_.stdout_debug) {
    stdout_sink_ = std::make_unique<sinks::StdoutDebugSink>();
  }

  if (config_.redis.enabled) {
    sinks::RedisTsOptions redis_options{};
    redis_options.host = config_.redis.host;
    redis_options.port = config_.redis.port;
    redis_options.unix_socket = config_.redis.unix_socket;
    redis_options.key_prefix = config_.redis.key_prefix;
    redis_options.logger = logger_;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(redis_options);

    if (redis_sink_->check_connectivity()) {
      logger_->info(kTag, "redis connectivity confirmed at " + describe_redis(config_.redis));
    } else {
      logger_->warn(kTag, "redis connectivity check failed at " + describe_redis(config_.redis));
    }
  }

  health::HealthMonitorConfig monitor_config{};
  monitor_config.interval = config_.health.interval;
  monitor_config.safe_mode_enabled = config_.health.safe_mode.enabled;
  monitor_config.auto_exit = config_.health.safe_mode.auto_exit;
  monitor_config.auto_exit_healthy_streak = config_.health.safe_mode.auto_exit_healthy_streak;

  health::HealthMonitorOptions monitor_options{};
  monitor_options.logger = logger_;
  monitor_options.safe_mode = safe_mode_;
  monitor_options.panic_stop = panic_stop_;
  monitor_options.on_snapshot = [this](const model::HealthSnapshot& snapshot) { publish_snapshot(snapshot); };
  monitor_options.now_ms = [this]() { return now_ms(); };
  monitor_ = std::make_unique<health::HealthMonitor>(monitor_config, monitor_options);

  const auto thresholds = config_.health.thresholds;
  auto metrics = metrics_;
  monitor_->register_check("vision", [metrics, thresholds]() {
    return metrics->build_vision_status(thresholds.vision_confidence_min);
  });
  monitor_->register_check("solver", [metrics, thresholds]() {
    return metrics->build_solver_status(thresholds.solver_latency_ms);
  });
  monitor_->register_check("executor", [metrics, thresholds]() {
    return metrics->build_executor_status(thresholds.executor_failure_rate);
  });
  monitor_->register_check("strategy", [metrics, thresholds]() {
    return metrics->build_strategy_status(thresholds.strategy_divergence_pp);
  });
}

DecisionRuntime::~DecisionRuntime() {
  stop_monitoring();
}

void DecisionRuntime::start_monitoring() {
  monitor_->start();
}

void DecisionRuntime::stop_monitoring() {
  if (monitor_ != nullptr) {
    monitor_->stop();
  }
}

CycleOutcome DecisionRuntime::run_cycle(const model::GameState& state, const std::vector<std::string>& parse_errors) {
  CycleOutcome outcome{};

  check_consistency(state, parse_errors, outcome);
  metrics_->record_vision_sample(state.confidence, now_ms());

  tracker_->start();
  outcome.result = decision::make_decision(state, config_.session_id, pipeline_deps_);

  const auto recorded_at = now_ms();
  metrics_->record_solver_sample(tracker_->consumed(budget::budget_component::GTO), outcome.result.solver_timed_out,
                                 recorded_at);
  metrics_->record_strategy_sample(outcome.result.decision, recorded_at);

  apply_safety_gate(outcome);

  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.cycles;
  if (outcome.result.solver_timed_out) {
    ++stats_.solver_timeouts;
  }
  stats_.consistency_violations += outcome.violations.size();
  if (!outcome.actionable) {
    ++stats_.blocked_decisions;
  }
  for (const auto component : budget::kComponentOrder) {
    budget::at(last_consumed_, component) = tracker_->consumed(component);
  }
  return outcome;
}

void DecisionRuntime::record_execution(const bool success) {
  metrics_->record_executor_sample(success, now_ms());
}

model::HealthSnapshot DecisionRuntime::check_health() {
  return monitor_->run_checks();
}

RuntimeStats DecisionRuntime::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

std::uint64_t DecisionRuntime::now_ms() const {
  return options_.now_ms ? options_.now_ms() : unix_timestamp_now_ms();
}

void DecisionRuntime::check_consistency(const model::GameState& state, const std::vector<std::string>& parse_errors,
                                        CycleOutcome& outcome) {
  outcome.violations = consistency_.observe(consistency::frame_from_state(state, parse_errors));

  if (!outcome.violations.empty()) {
    const std::string detail = join_violations(outcome.violations);
    logger_->warn(kTag, "hand " + state.hand_id + ": " + detail);
    panic_stop_->trigger({model::panic_type::VISION_CONFIDENCE, detail, now_ms()});
    return;
  }

  if (consistency_.should_trigger_emergency_stop(config_.consistency.emergency_stop_frames)) {
    std::ostringstream detail;
    detail << consistency_.consecutive_error_frames() << " consecutive frames with violations or parse errors";
    panic_stop_->trigger({model::panic_type::VISION_CONFIDENCE, detail.str(), now_ms()});
  }
}

void DecisionRuntime::apply_safety_gate(CycleOutcome& outcome) {
  auto& decision = outcome.result.decision;

  if (panic_stop_->is_active()) {
    decision.metadata.panic_stop = true;
    decision.reasoning.panic_stop = true;
    decision.reasoning.risk_check_passed = false;
    outcome.actionable = false;
    return;
  }

  if (safe_mode_->is_active()) {
    decision.metadata.preempted = true;
    decision.reasoning.risk_check_passed = false;
    outcome.actionable = false;
  }
}

void DecisionRuntime::publish_snapshot(const model::HealthSnapshot& snapshot) {
  if (snapshot.overall != model::health_state::HEALTHY) {
    for (const auto& status : snapshot.statuses) {
      if (status.state != model::health_state::HEALTHY) {
        logger_->debug("health", status.component + " " + model::to_string(status.state) + ": " +
                                     status.details.value_or("no details"));
      }
    }
  }

  if (stdout_sink_ != nullptr) {
    stdout_sink_->publish(snapshot);
  }

  if (redis_sink_ != nullptr) {
    budget::BudgetAllocation consumed{};
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      consumed = last_consumed_;
    }
    if (!redis_sink_->publish(snapshot, consumed)) {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.sink_errors;
    }
  }
}

}  // namespace decision_agent::core
