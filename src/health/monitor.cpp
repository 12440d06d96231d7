#include "health/monitor.hpp"

#include <exception>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#include "core/timestamp.hpp"

namespace decision_agent::health {
namespace {

constexpr const char* kTag = "health";

std::uint64_t random_session_salt() {
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32U) ^ static_cast<std::uint64_t>(device());
}

}  // namespace

HealthMonitor::HealthMonitor(HealthMonitorConfig config, HealthMonitorOptions options)
    : config_(config), options_(std::move(options)) {}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::register_check(std::string name, HealthCheck fn) {
  std::lock_guard<std::mutex> lock(checks_mutex_);
  checks_.push_back(Registration{std::move(name), std::move(fn)});
}

void HealthMonitor::start() {
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_) {
      return;
    }
    running_ = true;
    stop_requested_ = false;
  }

  run_checks();
  worker_ = std::thread([this]() { loop(); });
  core::logger_or_null(options_.logger)
      .info(kTag, "monitor started; interval_ms=" + std::to_string(config_.interval.count()));
}

void HealthMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!running_) {
      return;
    }
    stop_requested_ = true;
  }
  wake_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }

  std::lock_guard<std::mutex> lock(run_mutex_);
  running_ = false;
}

bool HealthMonitor::running() const {
  std::lock_guard<std::mutex> lock(run_mutex_);
  return running_;
}

model::HealthSnapshot HealthMonitor::run_checks() {
  std::vector<Registration> checks;
  {
    std::lock_guard<std::mutex> lock(checks_mutex_);
    checks = checks_;
  }

  std::lock_guard<std::mutex> tick_lock(tick_mutex_);
  core::Logger& log = core::logger_or_null(options_.logger);

  model::HealthSnapshot snapshot{};
  snapshot.statuses.reserve(checks.size());
  for (const auto& check : checks) {
    try {
      auto status = check.fn();
      if (status.component.empty()) {
        status.component = check.name;
      }
      if (status.checked_at_ms == 0) {
        status.checked_at_ms = now_ms();
      }
      snapshot.statuses.push_back(std::move(status));
    } catch (const std::exception& ex) {
      log.error(kTag, "health check failed: " + check.name + ": " + ex.what());
      model::HealthStatus failed{};
      failed.component = check.name;
      failed.state = model::health_state::FAILED;
      failed.checked_at_ms = now_ms();
      failed.details = ex.what();
      failed.consecutive_failures = 1;
      snapshot.statuses.push_back(std::move(failed));
    }
  }

  snapshot.overall = model::compute_overall_health(snapshot.statuses);
  if (options_.safe_mode != nullptr) {
    snapshot.safe_mode = options_.safe_mode->state();
  }
  if (options_.panic_stop != nullptr) {
    snapshot.panic_stop = options_.panic_stop->reason();
  }
  snapshot.issued_at_ms = now_ms();
  snapshot.id = next_snapshot_id();

  {
    std::lock_guard<std::mutex> lock(latest_mutex_);
    latest_ = snapshot;
  }

  handle_snapshot(snapshot);
  if (options_.on_snapshot) {
    options_.on_snapshot(snapshot);
  }
  return snapshot;
}

std::optional<model::HealthSnapshot> HealthMonitor::latest_snapshot() const {
  std::lock_guard<std::mutex> lock(latest_mutex_);
  return latest_;
}

std::uint32_t HealthMonitor::healthy_streak() const {
  std::lock_guard<std::mutex> lock(tick_mutex_);
  return healthy_streak_;
}

std::uint32_t HealthMonitor::degraded_streak() const {
  std::lock_guard<std::mutex> lock(tick_mutex_);
  return degraded_streak_;
}

void HealthMonitor::loop() {
  std::unique_lock<std::mutex> lock(run_mutex_);
  while (!stop_requested_) {
    if (wake_.wait_for(lock, config_.interval, [this]() { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    run_checks();
    lock.lock();
  }
}

void HealthMonitor::handle_snapshot(const model::HealthSnapshot& snapshot) {
  auto& safe_mode = options_.safe_mode;
  if (safe_mode == nullptr || !config_.safe_mode_enabled) {
    return;
  }

  const bool panic_active = options_.panic_stop != nullptr && options_.panic_stop->is_active();
  if (snapshot.overall == model::health_state::HEALTHY) {
    ++healthy_streak_;
    degraded_streak_ = 0;

    const auto state = safe_mode->state();
    const auto* active = std::get_if<model::SafeModeActive>(&state);
    if (active != nullptr && !active->manual && !panic_active && config_.auto_exit &&
        healthy_streak_ >= config_.auto_exit_healthy_streak) {
      safe_mode->exit();
    }
    return;
  }

  ++degraded_streak_;
  healthy_streak_ = 0;
  if (!panic_active) {
    safe_mode->enter(std::string("health:") + model::to_string(snapshot.overall));
  }
}

std::uint64_t HealthMonitor::now_ms() const {
  return options_.now_ms ? options_.now_ms() : core::unix_timestamp_now_ms();
}

std::string HealthMonitor::next_snapshot_id() {
  static const std::uint64_t salt = random_session_salt();
  std::ostringstream id;
  id << std::hex << std::setw(16) << std::setfill('0') << salt << '-' << std::dec << ++snapshot_sequence_;
  return id.str();
}

}  // namespace decision_agent::health
