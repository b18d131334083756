#pragma once

#include <cstdint>

namespace sentinel {

// -----------------------------------------------------------------------------
// ITimeProvider — the engine's only clock
// -----------------------------------------------------------------------------
//
// @brief  Epoch milliseconds, UTC. Every timestamp the engine writes (fills,
//         audit entries, kill-switch records, daily rollover) comes from here.
//
// @details
// Live deployments inject LiveTimeProvider; tests and replays inject
// SimulationTimeProvider and move time explicitly, which makes daily
// rollover, trading-window and staleness checks deterministic.
//
// Thread-safety: implementations must allow concurrent now_ms() calls.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace sentinel
