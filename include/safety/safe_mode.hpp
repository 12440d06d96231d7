#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "core/logger.hpp"
#include "model/health.hpp"

namespace decision_agent::safety {

// Latched safe-mode flag shared by the health monitor and the decision caller.
// The first reason wins; a manual latch is only cleared by a manual exit.
class SafeModeController {
 public:
  explicit SafeModeController(std::shared_ptr<core::Logger> logger = {});

  void enter(const std::string& reason, bool manual = false);
  void exit(bool manual = false);

  [[nodiscard]] bool is_active() const;
  [[nodiscard]] model::SafeModeState state() const;

 private:
  std::shared_ptr<core::Logger> logger_;
  mutable std::mutex mutex_;
  model::SafeModeState state_{model::SafeModeInactive{}};
};

}  // namespace decision_agent::safety
