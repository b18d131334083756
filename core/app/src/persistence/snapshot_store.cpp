#include "sentinel/persistence/snapshot_store.hpp"
#include "sentinel/codec/json_codec.hpp"
#include "sentinel/domain/errors.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace sentinel {

void to_json(nlohmann::json& j, const EngineSnapshot& value) {
  j = nlohmann::json{{"version", 1},
                     {"audit_sequence", value.audit_sequence},
                     {"taken_at_ms", value.taken_at_ms},
                     {"risk", value.risk},
                     {"positions", value.positions}};
}

void from_json(const nlohmann::json& j, EngineSnapshot& value) {
  value.audit_sequence = j.at("audit_sequence").get<std::uint64_t>();
  value.taken_at_ms = j.value("taken_at_ms", domain::TimestampMs{0});
  value.risk = j.at("risk").get<domain::RiskState>();
  value.positions = j.at("positions").get<std::vector<domain::Position>>();
}

SnapshotStore::SnapshotStore(std::string path) : path_(std::move(path)) {}

void SnapshotStore::save(const EngineSnapshot& snapshot) const {
  if (!enabled()) {
    return;
  }

  std::filesystem::path target(path_);
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throw PersistenceError("cannot create " +
                             target.parent_path().string() + ": " +
                             ec.message());
    }
  }

  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    if (!out) {
      throw PersistenceError("cannot open " + tmp);
    }
    out << nlohmann::json(snapshot).dump(2) << '\n';
    out.flush();
    if (!out) {
      throw PersistenceError("write failed on " + tmp);
    }
  }

  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    throw PersistenceError("cannot replace " + path_);
  }
}

std::optional<EngineSnapshot> SnapshotStore::load() const {
  if (!enabled() || !std::filesystem::exists(path_)) {
    return std::nullopt;
  }

  std::ifstream in(path_);
  if (!in) {
    throw PersistenceError("cannot open " + path_);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  try {
    return nlohmann::json::parse(buffer.str()).get<EngineSnapshot>();
  } catch (const nlohmann::json::exception& e) {
    throw PersistenceError("snapshot " + path_ + " unreadable: " + e.what());
  }
}

}  // namespace sentinel
