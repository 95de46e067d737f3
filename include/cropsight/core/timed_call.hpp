#pragma once

#include <cropsight/core/error.hpp>
#include <chrono>
#include <exception>
#include <expected>
#include <future>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

namespace cropsight::core {

/// Runs fn(stop_token) on its own thread and waits at most `timeout` for it.
///
/// On timeout a stop is requested and ErrorCode::Timeout is returned immediately; the
/// worker keeps running detached until fn observes the stop token (or its own I/O
/// timeout fires), so everything fn touches must be owned by the callable (capture
/// shared_ptrs and copies, never references to caller locals).
/// A timeout of zero or less runs fn inline without a deadline.
/// A std::exception thrown by fn is returned as `on_exception` with the exception text.
template <typename T, typename Fn>
[[nodiscard]] std::expected<T, Error> call_with_timeout(Fn fn,
                                                        std::chrono::milliseconds timeout,
                                                        ErrorCode on_exception = ErrorCode::ProviderFailed) {
  if (timeout.count() <= 0) {
    std::stop_source never_stopped;
    try {
      return fn(never_stopped.get_token());
    } catch (const std::exception& e) {
      return std::unexpected(make_error(on_exception, e.what()));
    }
  }

  std::stop_source stop;
  std::promise<std::expected<T, Error>> promise;
  auto future = promise.get_future();

  std::thread worker(
      [fn = std::move(fn), token = stop.get_token(), promise = std::move(promise),
       on_exception]() mutable {
        try {
          promise.set_value(fn(token));
        } catch (const std::exception& e) {
          promise.set_value(std::unexpected(make_error(on_exception, e.what())));
        }
      });
  worker.detach();

  if (future.wait_for(timeout) == std::future_status::ready) {
    return future.get();
  }
  stop.request_stop();
  return std::unexpected(make_error(
      ErrorCode::Timeout, "no response within " + std::to_string(timeout.count()) + " ms"));
}

}  // namespace cropsight::core
