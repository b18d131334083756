#pragma once

#include "sentinel/concurrent/thread_safe_queue.hpp"
#include "sentinel/domain/audit_entry.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace sentinel {

struct AuditReceipt {
  std::uint64_t sequence{0};
  std::string entry_hash;
};

// -----------------------------------------------------------------------------
// ChainVerification
// -----------------------------------------------------------------------------
// first_invalid_index is the 0-based position of the first entry whose link
// or hash does not check out. Everything from there on is untrusted.
// -----------------------------------------------------------------------------
struct ChainVerification {
  bool valid{true};
  std::size_t entries_checked{0};
  std::optional<std::size_t> first_invalid_index;
  std::string detail;
};

// -----------------------------------------------------------------------------
// AuditLog — append-only, SHA-256 hash-chained event log
// -----------------------------------------------------------------------------
//
// @brief  Records every decision, order transition, fill, kill-switch
//         transition, anomaly and reconciliation as a chain where each entry
//         commits to the previous entry's hash.
//
// @details
//   entry_hash = SHA256(previous_hash || payload)
//   payload    = canonical JSON {"data":..,"kind":..,"seq":..,"ts":..}
//
// The first entry's previous_hash is 64 '0' characters. Entries are written
// one JSON object per line to `path` and flushed before the append returns.
// An empty path keeps the chain in memory only (tests, dry runs).
//
// Thread model:
//   Single writer. record()/append() may be called from any thread; each
//   call enqueues the entry and blocks until the writer thread has assigned
//   its sequence, hashed it and flushed it. Callers therefore observe their
//   own entries in the order they were recorded, and an entry is durable
//   before any side effect that follows it.
//
//   Readers (verify, entries) take a shared lock and never block the writer
//   for longer than one vector push.
//
// Failure:
//   I/O failure surfaces as PersistenceError from record(). A chain that
//   fails verification on open() is still loaded; the caller decides.
//   Malformed lines throw ChainIntegrityError from open().
// -----------------------------------------------------------------------------
class AuditLog {
 public:
  static const std::string& genesisHash();

  AuditLog(std::string path, const ITimeProvider& clock);
  ~AuditLog();

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;
  AuditLog(AuditLog&&) = delete;
  AuditLog& operator=(AuditLog&&) = delete;

  // Loads any existing file and starts the writer. Idempotent.
  void open();

  // Drains pending appends, then stops the writer. Idempotent.
  void close();

  bool isOpen() const { return running_.load(); }

  AuditReceipt record(const std::string& kind, const nlohmann::json& data);

  std::string append(const std::string& kind, const nlohmann::json& data) {
    return record(kind, data).entry_hash;
  }

  ChainVerification verify() const;

  static ChainVerification verifyEntries(
      const std::vector<domain::AuditEntry>& entries);

  static std::string canonicalPayload(std::uint64_t sequence,
                                      const std::string& kind,
                                      domain::TimestampMs timestamp_ms,
                                      const nlohmann::json& data);

  // Parsed `data` object of an entry's payload.
  static nlohmann::json payloadData(const domain::AuditEntry& entry);

  std::vector<domain::AuditEntry> entries() const;
  std::vector<domain::AuditEntry> entriesAfter(std::uint64_t sequence) const;
  std::size_t size() const;
  std::uint64_t lastSequence() const;
  std::string lastHash() const;

  const std::string& path() const { return path_; }

 private:
  struct PendingAppend {
    std::string kind;
    nlohmann::json data;
    std::promise<AuditReceipt> done;
  };

  void load();
  void writerLoop();
  AuditReceipt write(const std::string& kind, const nlohmann::json& data);

  std::string path_;
  const ITimeProvider& clock_;

  std::unique_ptr<ThreadSafeQueue<PendingAppend>> queue_;
  std::thread writer_;
  std::atomic<bool> running_{false};
  std::ofstream file_;

  mutable std::shared_mutex entries_mutex_;
  std::vector<domain::AuditEntry> entries_;
};

}  // namespace sentinel
