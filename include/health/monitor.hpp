#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/logger.hpp"
#include "model/health.hpp"
#include "safety/panic_stop.hpp"
#include "safety/safe_mode.hpp"

namespace decision_agent::health {

struct HealthMonitorConfig {
  std::chrono::milliseconds interval{1000};
  bool safe_mode_enabled{true};
  bool auto_exit{true};
  std::uint32_t auto_exit_healthy_streak{2};
};

// May throw; a throwing check is reported as failed.
using HealthCheck = std::function<model::HealthStatus()>;
using SnapshotCallback = std::function<void(const model::HealthSnapshot&)>;

struct HealthMonitorOptions {
  std::shared_ptr<core::Logger> logger{};
  std::shared_ptr<safety::SafeModeController> safe_mode{};
  std::shared_ptr<safety::PanicStopController> panic_stop{};
  SnapshotCallback on_snapshot{};
  std::function<std::uint64_t()> now_ms{};
};

// Periodic aggregation of registered checks into one snapshot per tick.
//
// Only the latest snapshot is kept. A non-healthy tick enters safe mode
// unless a panic stop already owns it; consecutive healthy ticks may lift a
// non-manual safe mode again while no panic is latched.
class HealthMonitor {
 public:
  explicit HealthMonitor(HealthMonitorConfig config, HealthMonitorOptions options = {});
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  void register_check(std::string name, HealthCheck fn);

  // Runs one tick right away, then every interval on a worker thread.
  void start();
  void stop();
  [[nodiscard]] bool running() const;

  // One monitoring tick on the calling thread.
  model::HealthSnapshot run_checks();

  [[nodiscard]] std::optional<model::HealthSnapshot> latest_snapshot() const;
  [[nodiscard]] std::uint32_t healthy_streak() const;
  [[nodiscard]] std::uint32_t degraded_streak() const;

 private:
  struct Registration {
    std::string name;
    HealthCheck fn;
  };

  void loop();
  void handle_snapshot(const model::HealthSnapshot& snapshot);
  [[nodiscard]] std::uint64_t now_ms() const;
  std::string next_snapshot_id();

  HealthMonitorConfig config_;
  HealthMonitorOptions options_;

  mutable std::mutex checks_mutex_;
  std::vector<Registration> checks_{};

  mutable std::mutex tick_mutex_;
  std::uint32_t healthy_streak_{0};
  std::uint32_t degraded_streak_{0};
  std::uint64_t snapshot_sequence_{0};

  mutable std::mutex latest_mutex_;
  std::optional<model::HealthSnapshot> latest_{};

  mutable std::mutex run_mutex_;
  std::condition_variable wake_;
  bool running_{false};
  bool stop_requested_{false};
  std::thread worker_{};
};

}  // namespace decision_agent::health
