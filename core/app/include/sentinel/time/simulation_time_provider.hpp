#pragma once

#include "sentinel/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace sentinel {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
//
// @brief  A clock that only moves when told to.
//
// @details
// advance_time() jumps to an absolute time; advance_by() adds a delta. Neither
// enforces monotonicity so tests can construct any sequence they need.
//
// Thread-safety: all methods are atomic.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace sentinel
