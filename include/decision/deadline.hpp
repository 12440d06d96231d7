#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace decision_agent::decision {

// Raised while a call on a collaborator is running on a worker thread.
using InFlightFlag = std::atomic<bool>;

// Runs `fn` on a detached worker and waits at most `budget_ms` for it.
//
// Returns nullopt when the deadline passes first; the worker keeps running
// and its result is dropped, so `fn` must own everything it touches.
// An exception thrown by `fn` before the deadline is rethrown here.
//
// `in_flight`, when given, is set before the worker starts and cleared as
// soon as `fn` returns or throws, including after an abandoned call.
template <typename Fn>
std::optional<std::invoke_result_t<Fn>> call_with_deadline(Fn fn, const double budget_ms,
                                                           std::shared_ptr<InFlightFlag> in_flight = {}) {
  using Result = std::invoke_result_t<Fn>;

  auto promise = std::make_shared<std::promise<Result>>();
  auto future = promise->get_future();

  if (in_flight != nullptr) {
    in_flight->store(true);
  }
  try {
    std::thread worker([promise, in_flight, fn = std::move(fn)]() mutable {
      try {
        Result value = fn();
        if (in_flight != nullptr) {
          in_flight->store(false);
        }
        promise->set_value(std::move(value));
      } catch (...) {
        if (in_flight != nullptr) {
          in_flight->store(false);
        }
        promise->set_exception(std::current_exception());
      }
    });
    worker.detach();
  } catch (...) {
    if (in_flight != nullptr) {
      in_flight->store(false);
    }
    throw;
  }

  const auto budget = std::chrono::duration<double, std::milli>(budget_ms < 0.0 ? 0.0 : budget_ms);
  if (future.wait_for(budget) != std::future_status::ready) {
    return std::nullopt;
  }
  return future.get();
}

}  // namespace decision_agent::decision
