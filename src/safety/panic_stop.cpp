#include "safety/panic_stop.hpp"

#include <string>
#include <utility>

namespace decision_agent::safety {

PanicStopController::PanicStopController(std::shared_ptr<SafeModeController> safe_mode,
                                         std::shared_ptr<core::Logger> logger)
    : safe_mode_(std::move(safe_mode)), logger_(std::move(logger)) {}

void PanicStopController::trigger(const model::PanicStopReason& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reason_.has_value()) {
      return;
    }
    reason_ = reason;
  }

  core::logger_or_null(logger_).error("panic-stop", std::string("triggered (") + model::to_string(reason.type) +
                                                        "): " + reason.detail);
  if (safe_mode_ != nullptr) {
    safe_mode_->enter(std::string("panic:") + model::to_string(reason.type), false);
  }
}

void PanicStopController::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  reason_.reset();
}

bool PanicStopController::is_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reason_.has_value();
}

std::optional<model::PanicStopReason> PanicStopController::reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reason_;
}

}  // namespace decision_agent::safety
