#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace sentinel {

// -----------------------------------------------------------------------------
// callWithDeadline — run a blocking external call with a hard wait limit
// -----------------------------------------------------------------------------
//
// @brief  Runs `fn` on a detached worker and waits at most `deadline` for it.
//
// @details
// Returns the result if `fn` finished in time, std::nullopt if it did not.
// An exception thrown by `fn` in time is rethrown to the caller. A call that
// overruns keeps running on its worker and its result is discarded.
//
// Ownership:
//   `fn` is moved onto the worker. Anything it references (a venue, an FX
//   provider) must outlive the call even after the caller has given up.
// -----------------------------------------------------------------------------
template <typename Result, typename Fn>
std::optional<Result> callWithDeadline(Fn fn,
                                       std::chrono::milliseconds deadline) {
  auto promise = std::make_shared<std::promise<Result>>();
  std::future<Result> future = promise->get_future();

  std::thread([promise, fn = std::move(fn)]() mutable {
    try {
      promise->set_value(fn());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if (future.wait_for(deadline) != std::future_status::ready) {
    return std::nullopt;
  }
  return future.get();
}

}  // namespace sentinel
