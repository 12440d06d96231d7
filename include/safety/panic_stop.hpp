#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "core/logger.hpp"
#include "model/health.hpp"
#include "safety/panic_trigger.hpp"
#include "safety/safe_mode.hpp"

namespace decision_agent::safety {

// Holds at most one panic reason until reset(). Triggering also enters safe
// mode as "panic:<type>"; reset() leaves safe mode alone.
class PanicStopController final : public PanicTrigger {
 public:
  explicit PanicStopController(std::shared_ptr<SafeModeController> safe_mode,
                               std::shared_ptr<core::Logger> logger = {});

  void trigger(const model::PanicStopReason& reason) override;
  void reset();

  [[nodiscard]] bool is_active() const;
  [[nodiscard]] std::optional<model::PanicStopReason> reason() const;

 private:
  std::shared_ptr<SafeModeController> safe_mode_;
  std::shared_ptr<core::Logger> logger_;
  mutable std::mutex mutex_;
  std::optional<model::PanicStopReason> reason_{};
};

}  // namespace decision_agent::safety
