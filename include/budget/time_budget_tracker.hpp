#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "core/logger.hpp"

namespace decision_agent::budget {

// Pipeline order; overruns cascade towards later stages.
enum class budget_component : std::uint8_t {
  PERCEPTION = 0,
  GTO = 1,
  AGENTS = 2,
  SYNTHESIS = 3,
  EXECUTION = 4,
  BUFFER = 5,
};

inline constexpr std::size_t kComponentCount = 6;

inline constexpr std::array<budget_component, kComponentCount> kComponentOrder = {
    budget_component::PERCEPTION, budget_component::GTO,       budget_component::AGENTS,
    budget_component::SYNTHESIS,  budget_component::EXECUTION, budget_component::BUFFER,
};

const char* to_string(budget_component component) noexcept;
std::optional<budget_component> parse_budget_component(const std::string& value);

using BudgetAllocation = std::array<double, kComponentCount>;

inline constexpr double kDefaultTotalBudgetMs = 2000.0;
inline constexpr BudgetAllocation kDefaultBudgetAllocation = {70.0, 400.0, 1200.0, 100.0, 30.0, 200.0};

inline double& at(BudgetAllocation& allocation, const budget_component component) {
  return allocation[static_cast<std::size_t>(component)];
}

inline double at(const BudgetAllocation& allocation, const budget_component component) {
  return allocation[static_cast<std::size_t>(component)];
}

double sum(const BudgetAllocation& allocation) noexcept;

struct BudgetMetrics {
  std::size_t samples{0};
  double p50{0.0};
  double p95{0.0};
  double p99{0.0};
  double last_sample{0.0};
};

struct TimeBudgetTrackerOptions {
  double total_budget_ms{kDefaultTotalBudgetMs};
  BudgetAllocation allocation{kDefaultBudgetAllocation};
  std::size_t metrics_window{200};
  // Milliseconds on a monotonic clock; steady_clock when empty.
  std::function<double()> now{};
  std::shared_ptr<core::Logger> logger{};
};

// Per-cycle ledger of one wall-clock deadline split across pipeline stages.
//
// One cycle at a time: start() wipes the cycle state, so concurrent cycles
// need one tracker each. Calls are serialized internally so stages running
// on different threads may bracket themselves safely. Nothing here throws;
// use before start() reports zero remaining time and asks for preemption.
class TimeBudgetTracker {
 public:
  explicit TimeBudgetTracker(TimeBudgetTrackerOptions options = {});

  void start();
  [[nodiscard]] bool started() const;

  void start_component(budget_component component);
  // Returns the measured milliseconds, 0 without a matching start_component.
  double end_component(budget_component component);

  [[nodiscard]] double elapsed() const;
  [[nodiscard]] double remaining_total() const;
  [[nodiscard]] double remaining(budget_component component) const;

  bool reserve(budget_component component, double duration_ms);
  void release(budget_component component, double duration_ms);

  [[nodiscard]] bool should_preempt(budget_component component) const;
  [[nodiscard]] bool should_preempt_total(double threshold_ms) const;

  // Books a duration measured elsewhere. Overruns eat the buffer first, then
  // downstream allocations. With finalize, unused allocation refills the
  // buffer up to its configured size.
  void record_actual(budget_component component, double duration_ms, bool finalize = true);

  [[nodiscard]] BudgetAllocation allocation_snapshot() const;
  [[nodiscard]] double consumed(budget_component component) const;
  [[nodiscard]] BudgetMetrics metrics_snapshot(budget_component component) const;
  [[nodiscard]] double total_budget_ms() const noexcept { return total_budget_ms_; }

 private:
  static constexpr double kPreemptEpsilonMs = 0.5;

  double now() const;
  double elapsed_locked() const;
  double remaining_total_locked() const;
  double remaining_locked(budget_component component) const;
  void record_actual_locked(budget_component component, double duration_ms, bool finalize);
  void consume_reserved(budget_component component, double duration_ms);
  void push_metric(budget_component component, double duration_ms);
  void apply_overrun(budget_component component, double delta_ms);
  double consume_buffer(double delta_ms);
  double reduce_budget(budget_component component, double desired_ms);
  void return_to_buffer(double surplus_ms);

  double total_budget_ms_;
  BudgetAllocation base_allocation_;
  std::size_t metrics_window_;
  std::function<double()> now_;
  std::shared_ptr<core::Logger> logger_;

  mutable std::mutex mutex_;
  BudgetAllocation allocation_{};
  std::optional<double> cycle_start_{};
  std::array<double, kComponentCount> consumed_{};
  std::array<double, kComponentCount> reserved_{};
  std::array<std::optional<double>, kComponentCount> component_start_{};
  std::array<std::deque<double>, kComponentCount> metrics_{};
};

}  // namespace decision_agent::budget
