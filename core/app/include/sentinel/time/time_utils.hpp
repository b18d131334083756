#pragma once

#include <cstdint>

namespace sentinel {

constexpr std::int64_t kMillisPerMinute = 60 * 1000;
constexpr std::int64_t kMillisPerDay = 24 * 60 * kMillisPerMinute;

// -----------------------------------------------------------------------------
// utc_day(ms)
// -----------------------------------------------------------------------------
// @brief  Days since the Unix epoch for an epoch-ms timestamp (UTC). Two
//         timestamps are on the same trading day iff their utc_day matches.
//
// Floors toward negative infinity so pre-epoch values stay consistent.
// -----------------------------------------------------------------------------
inline std::int64_t utc_day(std::int64_t epoch_ms) {
  std::int64_t day = epoch_ms / kMillisPerDay;
  if (epoch_ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

// Epoch ms of 00:00 UTC on the given day.
inline std::int64_t utc_day_start_ms(std::int64_t day) {
  return day * kMillisPerDay;
}

}  // namespace sentinel
