#pragma once

#include "sentinel/time/i_time_provider.hpp"

namespace sentinel {

// Wall-clock time from std::chrono::system_clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace sentinel
