#pragma once

#include "sentinel/domain/types.hpp"

#include <cstdint>
#include <string>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// AuditEntry — one link of the hash chain
// -----------------------------------------------------------------------------
//
// @brief  entry_hash = SHA256(previous_hash || payload), hex encoded.
//
// @details
// payload is canonical JSON (sorted keys) carrying the sequence, kind,
// timestamp and the entry data, so every field that matters is covered by
// the hash. kind and timestamp_ms are duplicated outside the payload only as
// a convenience for readers; verification never trusts them.
//
// The first entry links to 64 '0' characters. sequence starts at 1.
// -----------------------------------------------------------------------------
struct AuditEntry {
  std::uint64_t sequence{0};
  std::string kind;
  TimestampMs timestamp_ms{0};
  std::string previous_hash;
  std::string payload;
  std::string entry_hash;
};

}  // namespace domain
}  // namespace sentinel
