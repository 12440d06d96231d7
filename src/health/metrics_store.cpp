#include "health/metrics_store.hpp"

#include <algorithm>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "core/timestamp.hpp"

namespace decision_agent::health {
namespace {

std::string format_fixed(const double value, const int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

model::HealthStatus make_status(const char* component, const model::health_state state,
                                std::optional<std::string> details, const std::uint64_t checked_at_ms,
                                const std::uint32_t consecutive_failures) {
  model::HealthStatus status{};
  status.component = component;
  status.state = state;
  status.details = std::move(details);
  status.checked_at_ms = checked_at_ms;
  status.consecutive_failures = consecutive_failures;
  return status;
}

}  // namespace

HealthMetricsStore::HealthMetricsStore(MetricsStoreOptions options, std::shared_ptr<safety::PanicTrigger> panic)
    : options_(std::move(options)), panic_(std::move(panic)) {}

void HealthMetricsStore::record_vision_sample(const double confidence, const std::uint64_t timestamp_ms) {
  bool trip = false;
  {
    std::lock_guard<std::mutex> lock(vision_.mutex);
    vision_.last_confidence = confidence;
    vision_.last_updated_ms = timestamp_ms;
    if (confidence < options_.panic.min_confidence) {
      ++vision_.low_confidence_streak;
      trip = vision_.low_confidence_streak >= options_.panic.vision_confidence_frames;
    } else {
      vision_.low_confidence_streak = 0;
    }
  }

  if (trip && panic_ != nullptr) {
    model::PanicStopReason reason{};
    reason.type = model::panic_type::VISION_CONFIDENCE;
    reason.detail = "Vision confidence " + format_fixed(confidence, 3) + " below " +
                    format_fixed(options_.panic.min_confidence, 3);
    reason.triggered_at_ms = timestamp_ms;
    panic_->trigger(reason);
  }
}

void HealthMetricsStore::record_solver_sample(const double latency_ms, const bool timed_out,
                                              const std::uint64_t timestamp_ms) {
  std::lock_guard<std::mutex> lock(solver_.mutex);
  solver_.last_latency_ms = latency_ms;
  solver_.last_updated_ms = timestamp_ms;
  if (timed_out) {
    ++solver_.timed_out_samples;
  }
}

void HealthMetricsStore::record_executor_sample(const bool success, const std::uint64_t timestamp_ms) {
  std::lock_guard<std::mutex> lock(executor_.mutex);
  executor_.last_updated_ms = timestamp_ms;
  ++executor_.total;
  if (!success) {
    ++executor_.failures;
  }
}

void HealthMetricsStore::record_strategy_sample(const model::StrategyDecision& decision,
                                                const std::uint64_t timestamp_ms) {
  std::lock_guard<std::mutex> lock(strategy_.mutex);
  strategy_.last_updated_ms = timestamp_ms;
  strategy_.last_divergence_pp = decision.reasoning.divergence_pp;
  strategy_.last_fallback_count = decision.reasoning.fallback_reason.has_value() ? 1U : 0U;
}

model::HealthStatus HealthMetricsStore::build_vision_status(const double min_confidence) {
  std::lock_guard<std::mutex> lock(vision_.mutex);
  const auto now = now_ms();

  auto state = model::health_state::HEALTHY;
  std::optional<std::string> details;
  if (age_ms(vision_.last_updated_ms) > options_.vision_max_age_ms) {
    state = model::health_state::FAILED;
    details = "stale vision feed";
    ++vision_.failure_streak;
  } else if (vision_.last_confidence < min_confidence) {
    state = model::health_state::DEGRADED;
    details = "confidence " + format_fixed(vision_.last_confidence, 3) + " < " + format_fixed(min_confidence, 3);
    ++vision_.failure_streak;
  } else {
    vision_.failure_streak = 0;
  }

  auto status = make_status("vision", state, std::move(details), now, vision_.failure_streak);
  status.metrics["confidence"] = vision_.last_confidence;
  status.metrics["low_confidence_streak"] = static_cast<double>(vision_.low_confidence_streak);
  return status;
}

model::HealthStatus HealthMetricsStore::build_solver_status(const double max_latency_ms) {
  std::lock_guard<std::mutex> lock(solver_.mutex);
  const auto now = now_ms();

  auto state = model::health_state::HEALTHY;
  std::optional<std::string> details;
  if (age_ms(solver_.last_updated_ms) > options_.solver_max_age_ms) {
    state = model::health_state::DEGRADED;
    details = "solver stats stale";
    ++solver_.failure_streak;
  } else if (solver_.last_latency_ms > max_latency_ms) {
    state = model::health_state::DEGRADED;
    details = "latency " + format_fixed(solver_.last_latency_ms, 1) + "ms > " + format_fixed(max_latency_ms, 1) + "ms";
    ++solver_.failure_streak;
  } else if (solver_.timed_out_samples > 0) {
    state = model::health_state::DEGRADED;
    details = "recent solver timeout";
    ++solver_.failure_streak;
  } else {
    solver_.failure_streak = 0;
  }

  auto status = make_status("solver", state, std::move(details), now, solver_.failure_streak);
  status.metrics["latency_ms"] = solver_.last_latency_ms;
  status.metrics["timed_out_samples"] = static_cast<double>(solver_.timed_out_samples);
  solver_.timed_out_samples = 0;
  return status;
}

model::HealthStatus HealthMetricsStore::build_executor_status(const double max_failure_rate) {
  std::lock_guard<std::mutex> lock(executor_.mutex);
  const auto now = now_ms();

  const double failure_rate =
      executor_.total == 0 ? 0.0 : static_cast<double>(executor_.failures) / static_cast<double>(executor_.total);

  auto state = model::health_state::HEALTHY;
  std::optional<std::string> details;
  if (age_ms(executor_.last_updated_ms) > options_.executor_max_age_ms) {
    state = model::health_state::DEGRADED;
    details = "executor idle";
    ++executor_.failure_streak;
  } else if (failure_rate > max_failure_rate) {
    state = model::health_state::DEGRADED;
    details = "failure rate " + format_fixed(failure_rate * 100.0, 1) + "% > " +
              format_fixed(max_failure_rate * 100.0, 1) + "%";
    ++executor_.failure_streak;
  } else {
    executor_.failure_streak = 0;
  }

  executor_.total = std::min(executor_.total, options_.executor_window);
  executor_.failures = std::min(executor_.failures, executor_.total);

  auto status = make_status("executor", state, std::move(details), now, executor_.failure_streak);
  status.metrics["failure_rate"] = failure_rate;
  return status;
}

model::HealthStatus HealthMetricsStore::build_strategy_status(const double max_divergence_pp) {
  std::lock_guard<std::mutex> lock(strategy_.mutex);
  const auto now = now_ms();

  auto state = model::health_state::HEALTHY;
  std::optional<std::string> details;
  if (age_ms(strategy_.last_updated_ms) > options_.strategy_max_age_ms) {
    state = model::health_state::DEGRADED;
    details = "strategy stats stale";
    ++strategy_.failure_streak;
  } else if (strategy_.last_divergence_pp > max_divergence_pp) {
    state = model::health_state::DEGRADED;
    details = "divergence " + format_fixed(strategy_.last_divergence_pp, 1) + "pp";
    ++strategy_.failure_streak;
  } else if (strategy_.last_fallback_count > 0) {
    state = model::health_state::DEGRADED;
    details = "recent fallback";
    ++strategy_.failure_streak;
  } else {
    strategy_.failure_streak = 0;
  }
  strategy_.last_fallback_count = 0;

  auto status = make_status("strategy", state, std::move(details), now, strategy_.failure_streak);
  status.metrics["divergence_pp"] = strategy_.last_divergence_pp;
  return status;
}

std::uint64_t HealthMetricsStore::now_ms() const {
  return options_.now_ms ? options_.now_ms() : core::unix_timestamp_now_ms();
}

std::uint64_t HealthMetricsStore::age_ms(const std::uint64_t last_updated_ms) const {
  const auto now = now_ms();
  return now > last_updated_ms ? now - last_updated_ms : 0;
}

}  // namespace decision_agent::health
