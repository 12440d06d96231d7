#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace decision_agent::core {

enum class log_level : std::uint8_t {
  DEBUG = 0,
  INFO = 1,
  WARN = 2,
  ERROR = 3,
};

const char* to_string(log_level level) noexcept;

// Diagnostics only. Nothing in the core branches on what a logger does.
class Logger {
 public:
  virtual ~Logger() = default;

  virtual void log(log_level level, const std::string& tag, const std::string& message) = 0;

  void debug(const std::string& tag, const std::string& message) { log(log_level::DEBUG, tag, message); }
  void info(const std::string& tag, const std::string& message) { log(log_level::INFO, tag, message); }
  void warn(const std::string& tag, const std::string& message) { log(log_level::WARN, tag, message); }
  void error(const std::string& tag, const std::string& message) { log(log_level::ERROR, tag, message); }
};

// Writes "[tag] message" lines, the same shape the agent has always printed.
class StreamLogger final : public Logger {
 public:
  explicit StreamLogger(std::ostream& out, log_level min_level = log_level::INFO);

  void log(log_level level, const std::string& tag, const std::string& message) override;

 private:
  std::ostream& out_;
  log_level min_level_;
  std::mutex mutex_;
};

class NullLogger final : public Logger {
 public:
  void log(log_level, const std::string&, const std::string&) override {}
};

std::shared_ptr<Logger> make_stderr_logger(log_level min_level = log_level::INFO);

// Never returns null; falls back to a process-wide NullLogger.
Logger& logger_or_null(const std::shared_ptr<Logger>& logger);

}  // namespace decision_agent::core
