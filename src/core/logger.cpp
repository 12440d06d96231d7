#include "core/logger.hpp"

#include <iostream>

namespace decision_agent::core {

const char* to_string(const log_level level) noexcept {
  switch (level) {
    case log_level::DEBUG:
      return "debug";
    case log_level::INFO:
      return "info";
    case log_level::WARN:
      return "warn";
    case log_level::ERROR:
      return "error";
  }
  return "unknown";
}

StreamLogger::StreamLogger(std::ostream& out, const log_level min_level) : out_(out), min_level_(min_level) {}

void StreamLogger::log(const log_level level, const std::string& tag, const std::string& message) {
  if (level < min_level_) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  out_ << '[' << tag << "] ";
  if (level >= log_level::WARN) {
    out_ << to_string(level) << ": ";
  }
  out_ << message << '\n';
}

std::shared_ptr<Logger> make_stderr_logger(const log_level min_level) {
  return std::make_shared<StreamLogger>(std::cerr, min_level);
}

Logger& logger_or_null(const std::shared_ptr<Logger>& logger) {
  static NullLogger null_logger;
  if (logger == nullptr) {
    return null_logger;
  }
  return *logger;
}

}  // namespace decision_agent::core
