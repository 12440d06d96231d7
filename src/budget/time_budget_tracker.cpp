#include "budget/time_budget_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>
#include <vector>

#include "core/math.hpp"
#include "core/timestamp.hpp"

namespace decision_agent::budget {
namespace {

std::size_t index_of(const budget_component component) {
  return static_cast<std::size_t>(component);
}

}  // namespace

const char* to_string(const budget_component component) noexcept {
  switch (component) {
    case budget_component::PERCEPTION:
      return "perception";
    case budget_component::GTO:
      return "gto";
    case budget_component::AGENTS:
      return "agents";
    case budget_component::SYNTHESIS:
      return "synthesis";
    case budget_component::EXECUTION:
      return "execution";
    case budget_component::BUFFER:
      return "buffer";
  }
  return "buffer";
}

std::optional<budget_component> parse_budget_component(const std::string& value) {
  for (const auto component : kComponentOrder) {
    if (value == to_string(component)) {
      return component;
    }
  }
  return std::nullopt;
}

double sum(const BudgetAllocation& allocation) noexcept {
  double total = 0.0;
  for (const double value : allocation) {
    total += value;
  }
  return total;
}

TimeBudgetTracker::TimeBudgetTracker(TimeBudgetTrackerOptions options)
    : total_budget_ms_(core::clamp_non_negative(options.total_budget_ms)),
      base_allocation_(options.allocation),
      metrics_window_(options.metrics_window == 0 ? 1 : options.metrics_window),
      now_(std::move(options.now)),
      logger_(std::move(options.logger)) {
  for (double& value : base_allocation_) {
    value = core::clamp_non_negative(value);
  }
  allocation_ = base_allocation_;
}

void TimeBudgetTracker::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  cycle_start_ = now();
  allocation_ = base_allocation_;
  consumed_.fill(0.0);
  reserved_.fill(0.0);
  component_start_.fill(std::nullopt);
}

bool TimeBudgetTracker::started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cycle_start_.has_value();
}

void TimeBudgetTracker::start_component(const budget_component component) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cycle_start_.has_value()) {
    return;
  }
  component_start_[index_of(component)] = now();
}

double TimeBudgetTracker::end_component(const budget_component component) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& start = component_start_[index_of(component)];
  if (!start.has_value()) {
    return 0.0;
  }
  const double duration = core::clamp_non_negative(now() - *start);
  start.reset();
  record_actual_locked(component, duration, true);
  return duration;
}

double TimeBudgetTracker::elapsed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return elapsed_locked();
}

double TimeBudgetTracker::remaining_total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return remaining_total_locked();
}

double TimeBudgetTracker::remaining(const budget_component component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return remaining_locked(component);
}

bool TimeBudgetTracker::reserve(const budget_component component, const double duration_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cycle_start_.has_value() || !std::isfinite(duration_ms)) {
    return false;
  }
  if (duration_ms <= 0.0) {
    return true;
  }
  if (remaining_locked(component) < duration_ms) {
    return false;
  }
  reserved_[index_of(component)] += duration_ms;
  return true;
}

void TimeBudgetTracker::release(const budget_component component, const double duration_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!std::isfinite(duration_ms) || duration_ms <= 0.0) {
    return;
  }
  auto& reserved = reserved_[index_of(component)];
  reserved = core::clamp_non_negative(reserved - duration_ms);
}

bool TimeBudgetTracker::should_preempt(const budget_component component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cycle_start_.has_value()) {
    return true;
  }
  if (elapsed_locked() >= total_budget_ms_ - kPreemptEpsilonMs) {
    return true;
  }

  const auto& start = component_start_[index_of(component)];
  if (!start.has_value()) {
    return remaining_locked(component) <= 0.0;
  }
  const double running = now() - *start;
  return running + consumed_[index_of(component)] >= at(allocation_, component);
}

bool TimeBudgetTracker::should_preempt_total(const double threshold_ms) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cycle_start_.has_value()) {
    return true;
  }
  return remaining_total_locked() < threshold_ms;
}

void TimeBudgetTracker::record_actual(const budget_component component, const double duration_ms,
                                      const bool finalize) {
  std::lock_guard<std::mutex> lock(mutex_);
  record_actual_locked(component, duration_ms, finalize);
}

BudgetAllocation TimeBudgetTracker::allocation_snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return allocation_;
}

double TimeBudgetTracker::consumed(const budget_component component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consumed_[index_of(component)];
}

BudgetMetrics TimeBudgetTracker::metrics_snapshot(const budget_component component) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& history = metrics_[index_of(component)];
  if (history.empty()) {
    return {};
  }

  std::vector<double> sorted(history.begin(), history.end());
  std::sort(sorted.begin(), sorted.end());

  BudgetMetrics metrics{};
  metrics.samples = history.size();
  metrics.p50 = core::percentile(sorted, 50.0);
  metrics.p95 = core::percentile(sorted, 95.0);
  metrics.p99 = core::percentile(sorted, 99.0);
  metrics.last_sample = history.back();
  return metrics;
}

double TimeBudgetTracker::now() const {
  return now_ ? now_() : core::monotonic_now_ms();
}

double TimeBudgetTracker::elapsed_locked() const {
  if (!cycle_start_.has_value()) {
    return 0.0;
  }
  return core::clamp_non_negative(now() - *cycle_start_);
}

double TimeBudgetTracker::remaining_total_locked() const {
  if (!cycle_start_.has_value()) {
    return 0.0;
  }
  return core::clamp_non_negative(total_budget_ms_ - elapsed_locked());
}

double TimeBudgetTracker::remaining_locked(const budget_component component) const {
  if (!cycle_start_.has_value()) {
    return 0.0;
  }
  const std::size_t idx = index_of(component);
  const double own = core::clamp_non_negative(allocation_[idx] - consumed_[idx] - reserved_[idx]);
  return std::min(own, remaining_total_locked());
}

void TimeBudgetTracker::record_actual_locked(const budget_component component, const double duration_ms,
                                             const bool finalize) {
  if (!cycle_start_.has_value() || !std::isfinite(duration_ms) || duration_ms < 0.0) {
    return;
  }

  const std::size_t idx = index_of(component);
  const double limit = allocation_[idx];
  const double prior = consumed_[idx];
  const double remaining_before = core::clamp_non_negative(limit - prior);

  consume_reserved(component, duration_ms);
  consumed_[idx] = prior + duration_ms;
  push_metric(component, duration_ms);

  if (remaining_before <= 0.0) {
    apply_overrun(component, duration_ms);
    return;
  }
  if (duration_ms > remaining_before) {
    apply_overrun(component, duration_ms - remaining_before);
    return;
  }
  if (finalize) {
    return_to_buffer(remaining_before - duration_ms);
  }
}

void TimeBudgetTracker::consume_reserved(const budget_component component, const double duration_ms) {
  auto& reserved = reserved_[index_of(component)];
  if (reserved <= 0.0) {
    return;
  }
  reserved -= std::min(duration_ms, reserved);
}

void TimeBudgetTracker::push_metric(const budget_component component, const double duration_ms) {
  auto& history = metrics_[index_of(component)];
  history.push_back(duration_ms);
  while (history.size() > metrics_window_) {
    history.pop_front();
  }
}

void TimeBudgetTracker::apply_overrun(const budget_component component, const double delta_ms) {
  double outstanding = consume_buffer(delta_ms);
  for (std::size_t idx = index_of(component) + 1; idx < kComponentCount && outstanding > 0.0; ++idx) {
    const auto downstream = kComponentOrder[idx];
    if (downstream == budget_component::BUFFER) {
      continue;
    }
    outstanding -= reduce_budget(downstream, outstanding);
  }

  if (outstanding > 0.0) {
    std::ostringstream message;
    message << "exhausted all downstream budgets after " << to_string(component) << " overrun; "
            << outstanding << "ms unrecovered";
    core::logger_or_null(logger_).warn("budget", message.str());
  }
}

double TimeBudgetTracker::consume_buffer(const double delta_ms) {
  if (delta_ms <= 0.0) {
    return 0.0;
  }
  auto& buffer = at(allocation_, budget_component::BUFFER);
  const double available = core::clamp_non_negative(buffer);
  const double taken = std::min(delta_ms, available);
  buffer = available - taken;
  return delta_ms - taken;
}

double TimeBudgetTracker::reduce_budget(const budget_component component, const double desired_ms) {
  const std::size_t idx = index_of(component);
  const double headroom = core::clamp_non_negative(allocation_[idx] - consumed_[idx]);
  if (headroom <= 0.0) {
    return 0.0;
  }
  const double applied = std::min(desired_ms, headroom);
  allocation_[idx] -= applied;
  return applied;
}

void TimeBudgetTracker::return_to_buffer(const double surplus_ms) {
  if (surplus_ms <= 0.0) {
    return;
  }
  auto& buffer = at(allocation_, budget_component::BUFFER);
  const double headroom = core::clamp_non_negative(at(base_allocation_, budget_component::BUFFER) - buffer);
  if (headroom <= 0.0) {
    return;
  }
  buffer += std::min(surplus_ms, headroom);
}

}  // namespace decision_agent::budget
