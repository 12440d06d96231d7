#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "budget/time_budget_tracker.hpp"
#include "core/logger.hpp"
#include "model/health.hpp"

struct redisContext;

namespace decision_agent::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"decision:agent"};
  std::uint32_t connect_timeout_ms{1000};
  // Series suffixes to publish, e.g. "health:overall"; all known when empty.
  std::vector<std::string> enabled_metrics{};
  std::shared_ptr<core::Logger> logger{};
};

// Health telemetry as RedisTimeSeries samples, one TS.MADD per snapshot.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();

  // `consumed` is the per-component spend of the most recent decision cycle.
  bool publish(const model::HealthSnapshot& snapshot, const budget::BudgetAllocation& consumed);

  [[nodiscard]] const std::vector<std::string>& enabled_metrics() const noexcept { return enabled_metrics_; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema();
  bool publish_impl(const model::HealthSnapshot& snapshot, const budget::BudgetAllocation& consumed);
  void note_failure(const std::string& message);
  void note_success();

  RedisTsOptions options_;
  std::vector<std::string> enabled_metrics_{};
  std::unordered_set<std::string> enabled_metric_set_{};
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
  bool failing_{false};
};

}  // namespace decision_agent::sinks
