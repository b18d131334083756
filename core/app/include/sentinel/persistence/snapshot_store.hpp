#pragma once

#include "sentinel/domain/position.hpp"
#include "sentinel/domain/risk_state.hpp"
#include "sentinel/domain/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sentinel {

// State that must survive a restart, plus the audit watermark it reflects.
// Fills recorded after audit_sequence are replayed on top at startup.
struct EngineSnapshot {
  std::uint64_t audit_sequence{0};
  domain::RiskState risk;
  std::vector<domain::Position> positions;
  domain::TimestampMs taken_at_ms{0};
};

void to_json(nlohmann::json& j, const EngineSnapshot& value);
void from_json(const nlohmann::json& j, EngineSnapshot& value);

// -----------------------------------------------------------------------------
// SnapshotStore — one JSON file, replaced atomically
// -----------------------------------------------------------------------------
//
// @details
// save() writes "<path>.tmp", flushes, then renames over <path>, so a crash
// mid-write leaves the previous snapshot intact. An empty path disables the
// store (save is a no-op, load returns nullopt).
//
// Errors: I/O failure and unparseable content throw PersistenceError.
// -----------------------------------------------------------------------------
class SnapshotStore {
 public:
  explicit SnapshotStore(std::string path);

  void save(const EngineSnapshot& snapshot) const;

  // nullopt when no snapshot has been written yet.
  std::optional<EngineSnapshot> load() const;

  bool enabled() const { return !path_.empty(); }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace sentinel
