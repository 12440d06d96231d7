#include "safety/safe_mode.hpp"

#include <utility>
#include <variant>

#include "core/timestamp.hpp"

namespace decision_agent::safety {

SafeModeController::SafeModeController(std::shared_ptr<core::Logger> logger) : logger_(std::move(logger)) {}

void SafeModeController::enter(const std::string& reason, const bool manual) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (model::is_active(state_)) {
      return;
    }
    state_ = model::SafeModeActive{reason, core::unix_timestamp_now_ms(), manual};
  }
  core::logger_or_null(logger_).warn("safe-mode", "entered: " + reason + (manual ? " (manual)" : ""));
}

void SafeModeController::exit(const bool manual) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* active = std::get_if<model::SafeModeActive>(&state_);
    if (active == nullptr) {
      return;
    }
    if (active->manual && !manual) {
      return;
    }
    state_ = model::SafeModeInactive{};
  }
  core::logger_or_null(logger_).info("safe-mode", "exited");
}

bool SafeModeController::is_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return model::is_active(state_);
}

model::SafeModeState SafeModeController::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

}  // namespace decision_agent::safety
