#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "model/decision.hpp"
#include "model/health.hpp"
#include "safety/panic_trigger.hpp"

namespace decision_agent::health {

struct PanicThresholds {
  std::uint32_t vision_confidence_frames{3};
  double min_confidence{0.99};
};

struct MetricsStoreOptions {
  PanicThresholds panic{};
  std::uint64_t vision_max_age_ms{15'000};
  std::uint64_t solver_max_age_ms{30'000};
  std::uint64_t executor_max_age_ms{30'000};
  std::uint64_t strategy_max_age_ms{60'000};
  std::uint64_t executor_window{100};
  // Unix milliseconds; system_clock when empty.
  std::function<std::uint64_t()> now_ms{};
};

// Rolling per-subsystem telemetry behind the periodic health checks.
//
// Each subsystem writes only its own buffer through record_*_sample(); the
// matching build_*_status() reads it and clears the "since last check"
// counters. Every buffer has its own lock.
class HealthMetricsStore {
 public:
  explicit HealthMetricsStore(MetricsStoreOptions options = {}, std::shared_ptr<safety::PanicTrigger> panic = {});

  // A run of panic.vision_confidence_frames samples below
  // panic.min_confidence trips the panic trigger directly.
  void record_vision_sample(double confidence, std::uint64_t timestamp_ms);
  void record_solver_sample(double latency_ms, bool timed_out, std::uint64_t timestamp_ms);
  void record_executor_sample(bool success, std::uint64_t timestamp_ms);
  void record_strategy_sample(const model::StrategyDecision& decision, std::uint64_t timestamp_ms);

  model::HealthStatus build_vision_status(double min_confidence);
  model::HealthStatus build_solver_status(double max_latency_ms);
  model::HealthStatus build_executor_status(double max_failure_rate);
  model::HealthStatus build_strategy_status(double max_divergence_pp = 30.0);

 private:
  struct VisionBuffer {
    std::mutex mutex;
    double last_confidence{1.0};
    std::uint64_t last_updated_ms{0};
    std::uint32_t low_confidence_streak{0};
    std::uint32_t failure_streak{0};
  };

  struct SolverBuffer {
    std::mutex mutex;
    double last_latency_ms{0.0};
    std::uint64_t last_updated_ms{0};
    std::uint32_t timed_out_samples{0};
    std::uint32_t failure_streak{0};
  };

  struct ExecutorBuffer {
    std::mutex mutex;
    std::uint64_t total{0};
    std::uint64_t failures{0};
    std::uint64_t last_updated_ms{0};
    std::uint32_t failure_streak{0};
  };

  struct StrategyBuffer {
    std::mutex mutex;
    double last_divergence_pp{0.0};
    std::uint32_t last_fallback_count{0};
    std::uint64_t last_updated_ms{0};
    std::uint32_t failure_streak{0};
  };

  [[nodiscard]] std::uint64_t now_ms() const;
  [[nodiscard]] std::uint64_t age_ms(std::uint64_t last_updated_ms) const;

  MetricsStoreOptions options_;
  std::shared_ptr<safety::PanicTrigger> panic_;

  VisionBuffer vision_;
  SolverBuffer solver_;
  ExecutorBuffer executor_;
  StrategyBuffer strategy_;
};

}  // namespace decision_agent::health
