#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace decision_agent::model {

// Ordered: aggregation takes the maximum.
enum class health_state : std::uint8_t {
  HEALTHY = 0,
  DEGRADED = 1,
  FAILED = 2,
};

const char* to_string(health_state state) noexcept;

struct HealthStatus {
  std::string component{};
  health_state state{health_state::HEALTHY};
  std::uint64_t checked_at_ms{0};
  std::optional<std::string> details{};
  std::map<std::string, double> metrics{};
  std::uint32_t consecutive_failures{0};
};

health_state compute_overall_health(const std::vector<HealthStatus>& statuses) noexcept;

struct SafeModeInactive {};

struct SafeModeActive {
  std::string reason;
  std::uint64_t entered_at_ms{0};
  bool manual{false};
};

using SafeModeState = std::variant<SafeModeInactive, SafeModeActive>;

inline bool is_active(const SafeModeState& state) noexcept {
  return std::holds_alternative<SafeModeActive>(state);
}

enum class panic_type : std::uint8_t {
  VISION_CONFIDENCE = 0,
  RISK_LIMIT = 1,
  MANUAL = 2,
};

const char* to_string(panic_type type) noexcept;

struct PanicStopReason {
  panic_type type{panic_type::MANUAL};
  std::string detail{};
  std::uint64_t triggered_at_ms{0};
};

struct HealthSnapshot {
  std::string id{};
  health_state overall{health_state::HEALTHY};
  std::vector<HealthStatus> statuses{};
  SafeModeState safe_mode{SafeModeInactive{}};
  std::optional<PanicStopReason> panic_stop{};
  std::uint64_t issued_at_ms{0};
};

}  // namespace decision_agent::model
