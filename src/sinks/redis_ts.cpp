#include "sinks/redis_ts.hpp"

#include <cstddef>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace decision_agent::sinks {
namespace {

constexpr const char* kTag = "redis";

const char* const kHealthComponents[] = {"vision", "solver", "executor", "strategy"};

void add_metric_args(std::vector<std::string>& args, const std::string& key_prefix,
                     const std::uint64_t timestamp_ms, const std::string& suffix, const double value) {
  args.emplace_back(key_prefix + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

const std::vector<std::string>& default_metric_suffixes() {
  static const std::vector<std::string> kMetricSuffixes = [] {
    std::vector<std::string> suffixes = {"health:overall", "safety:safe_mode", "safety:panic_stop"};
    for (const char* component : kHealthComponents) {
      suffixes.emplace_back(std::string("health:") + component);
      suffixes.emplace_back(std::string("health:") + component + ":failures");
    }
    for (const auto component : budget::kComponentOrder) {
      suffixes.emplace_back(std::string("budget:") + budget::to_string(component) + "_consumed");
    }
    return suffixes;
  }();
  return kMetricSuffixes;
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  enabled_metrics_ = options_.enabled_metrics.empty() ? default_metric_suffixes() : options_.enabled_metrics;
  enabled_metric_set_ = std::unordered_set<std::string>(enabled_metrics_.begin(), enabled_metrics_.end());

  const std::size_t max_args = 1 + (enabled_metrics_.size() * 3);
  command_args_.reserve(max_args);
  command_argv_.reserve(max_args);
  command_argv_len_.reserve(max_args);
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

void RedisTsSink::note_failure(const std::string& message) {
  if (!failing_) {
    core::logger_or_null(options_.logger).warn(kTag, message);
  }
  failing_ = true;
}

void RedisTsSink::note_success() {
  if (failing_) {
    core::logger_or_null(options_.logger).info(kTag, "publishing recovered");
  }
  failing_ = false;
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      note_failure(std::string("connect failed: ") + raw->errstr);
      redisFree(raw);
    } else {
      note_failure("connect failed: out of memory");
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db() || !ensure_schema()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    note_failure("AUTH rejected");
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const auto& suffix : enabled_metrics_) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      core::logger_or_null(options_.logger)
          .error(kTag, "RedisTimeSeries module not available (TS.CREATE unknown command)");
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      note_failure("schema error on TS.CREATE " + key + ": " + reply_message);
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(const model::HealthSnapshot& snapshot, const budget::BudgetAllocation& consumed) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(snapshot, consumed)) {
    note_success();
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  if (!publish_impl(snapshot, consumed)) {
    note_failure("TS.MADD failed after reconnect");
    return false;
  }
  note_success();
  return true;
}

bool RedisTsSink::publish_impl(const model::HealthSnapshot& snapshot, const budget::BudgetAllocation& consumed) {
  const std::uint64_t timestamp_ms = snapshot.issued_at_ms;

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_metric = [&](const std::string& suffix, const double value) {
    if (enabled_metric_set_.find(suffix) == enabled_metric_set_.end()) {
      return;
    }
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, suffix, value);
  };

  append_metric("health:overall", static_cast<double>(static_cast<std::uint8_t>(snapshot.overall)));
  for (const auto& status : snapshot.statuses) {
    append_metric("health:" + status.component, static_cast<double>(static_cast<std::uint8_t>(status.state)));
    append_metric("health:" + status.component + ":failures", static_cast<double>(status.consecutive_failures));
  }
  append_metric("safety:safe_mode", model::is_active(snapshot.safe_mode) ? 1.0 : 0.0);
  append_metric("safety:panic_stop", snapshot.panic_stop.has_value() ? 1.0 : 0.0);
  for (const auto component : budget::kComponentOrder) {
    append_metric(std::string("budget:") + budget::to_string(component) + "_consumed",
                  budget::at(consumed, component));
  }

  if (command_args_.size() == 1) {
    return true;
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

}  // namespace decision_agent::sinks
