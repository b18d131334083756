#pragma once

#include "sentinel/concurrent/cancellation.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>

namespace sentinel {

// -----------------------------------------------------------------------------
// RetryPolicy — bounded exponential backoff
// -----------------------------------------------------------------------------
//
// @brief  Used for idempotent external reads (trade history, FX lookups).
//         Order placement is never retried.
//
// @details
// Attempt n (0-based) sleeps initial_delay * multiplier^n, capped at
// max_delay, before attempt n+1. At most max_attempts calls are made.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds initial_delay{50};
  std::chrono::milliseconds max_delay{1000};
  double multiplier{2.0};

  std::chrono::milliseconds delayFor(int attempt) const {
    double delay = static_cast<double>(initial_delay.count());
    for (int i = 0; i < attempt; ++i) {
      delay *= multiplier;
    }
    auto capped = std::min<double>(delay, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
  }
};

// -----------------------------------------------------------------------------
// retryWithBackoff(policy, token, fn)
// -----------------------------------------------------------------------------
//
// @brief  Calls fn() until it yields a value, the attempts run out, or the
//         token is cancelled.
//
// @param  fn  Callable returning std::optional<R>; nullopt means "failed,
//             try again".
//
// @return The first engaged result, or std::nullopt.
//
// @details
// Backoff sleeps in short steps so a cancelled token stops the wait within
// one step rather than after the full delay.
// -----------------------------------------------------------------------------
template <typename Fn>
auto retryWithBackoff(const RetryPolicy& policy, const CancellationToken& token,
                      Fn&& fn) -> decltype(fn()) {
  constexpr auto kSleepStep = std::chrono::milliseconds(10);

  for (int attempt = 0; attempt < std::max(policy.max_attempts, 1); ++attempt) {
    if (token.cancelled()) {
      break;
    }
    auto result = fn();
    if (result.has_value()) {
      return result;
    }
    if (attempt + 1 >= policy.max_attempts) {
      break;
    }
    auto remaining = policy.delayFor(attempt);
    while (remaining.count() > 0 && !token.cancelled()) {
      auto step = std::min(remaining, std::chrono::milliseconds(kSleepStep));
      std::this_thread::sleep_for(step);
      remaining -= step;
    }
  }
  return std::nullopt;
}

}  // namespace sentinel
