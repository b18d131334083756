#include "sentinel/audit/audit_log.hpp"
#include "sentinel/audit/digest.hpp"
#include "sentinel/domain/errors.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

namespace sentinel {

namespace {

constexpr auto kWriterIdleTimeout = std::chrono::milliseconds(50);

}  // namespace

const std::string& AuditLog::genesisHash() {
  static const std::string kGenesis(64, '0');
  return kGenesis;
}

AuditLog::AuditLog(std::string path, const ITimeProvider& clock)
    : path_(std::move(path)), clock_(clock) {}

AuditLog::~AuditLog() { close(); }

// -----------------------------------------------------------------------------
// canonicalPayload: the exact bytes that get hashed
// -----------------------------------------------------------------------------
std::string AuditLog::canonicalPayload(std::uint64_t sequence,
                                       const std::string& kind,
                                       domain::TimestampMs timestamp_ms,
                                       const nlohmann::json& data) {
  nlohmann::json payload{{"data", data},
                         {"kind", kind},
                         {"seq", sequence},
                         {"ts", timestamp_ms}};
  return payload.dump();
}

nlohmann::json AuditLog::payloadData(const domain::AuditEntry& entry) {
  auto parsed = nlohmann::json::parse(entry.payload, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("data")) {
    return nlohmann::json::object();
  }
  return parsed.at("data");
}

// -----------------------------------------------------------------------------
// open(): load the existing chain, open the file for append, start writer
// -----------------------------------------------------------------------------
void AuditLog::open() {
  if (running_.load()) {
    return;
  }

  load();

  if (!path_.empty()) {
    const std::filesystem::path file_path(path_);
    std::error_code ec;
    if (file_path.has_parent_path()) {
      std::filesystem::create_directories(file_path.parent_path(), ec);
      if (ec) {
        throw PersistenceError("cannot create audit directory " +
                               file_path.parent_path().string() + ": " +
                               ec.message());
      }
    }
    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
      throw PersistenceError("cannot open audit log " + path_);
    }
  }

  queue_ = std::make_unique<ThreadSafeQueue<PendingAppend>>();
  running_.store(true);
  writer_ = std::thread([this] { writerLoop(); });

  std::cout << "[AuditLog] opened " << (path_.empty() ? "<memory>" : path_)
            << " with " << size() << " entr" << (size() == 1 ? "y" : "ies")
            << ".\n";
}

void AuditLog::close() {
  if (!running_.exchange(false)) {
    return;
  }
  queue_->close();
  if (writer_.joinable()) {
    writer_.join();
  }
  if (file_.is_open()) {
    file_.close();
  }
}

// -----------------------------------------------------------------------------
// load(): parse one JSON object per line
// -----------------------------------------------------------------------------
void AuditLog::load() {
  std::vector<domain::AuditEntry> loaded;
  if (!path_.empty() && std::filesystem::exists(path_)) {
    std::ifstream in(path_);
    if (!in.is_open()) {
      throw PersistenceError("cannot read audit log " + path_);
    }
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
      ++line_no;
      if (line.empty()) {
        continue;
      }
      auto j = nlohmann::json::parse(line, nullptr, false);
      if (j.is_discarded() || !j.is_object()) {
        throw ChainIntegrityError("audit log line " + std::to_string(line_no) +
                                  " is not valid JSON");
      }
      try {
        domain::AuditEntry entry;
        entry.sequence = j.at("sequence").get<std::uint64_t>();
        entry.previous_hash = j.at("previous_hash").get<std::string>();
        entry.payload = j.at("payload").get<std::string>();
        entry.entry_hash = j.at("entry_hash").get<std::string>();
        entry.kind = j.value("kind", "");
        entry.timestamp_ms = j.value("timestamp_ms", domain::TimestampMs{0});
        loaded.push_back(std::move(entry));
      } catch (const nlohmann::json::exception& e) {
        throw ChainIntegrityError("audit log line " + std::to_string(line_no) +
                                  ": " + e.what());
      }
    }
  }

  std::unique_lock lock(entries_mutex_);
  entries_ = std::move(loaded);
}

// -----------------------------------------------------------------------------
// record(): enqueue and wait for the writer
// -----------------------------------------------------------------------------
AuditReceipt AuditLog::record(const std::string& kind,
                              const nlohmann::json& data) {
  if (!running_.load()) {
    throw PersistenceError("audit log is not open");
  }
  PendingAppend pending{kind, data, {}};
  auto future = pending.done.get_future();
  if (!queue_->push(std::move(pending))) {
    throw PersistenceError("audit log is closing");
  }
  return future.get();
}

// -----------------------------------------------------------------------------
// writerLoop(): the only thread that extends the chain
// -----------------------------------------------------------------------------
void AuditLog::writerLoop() {
  for (;;) {
    auto pending = queue_->pop_for(kWriterIdleTimeout);
    if (!pending) {
      if (queue_->closed() && queue_->empty()) {
        return;
      }
      continue;
    }
    try {
      pending->done.set_value(write(pending->kind, pending->data));
    } catch (const std::exception& e) {
      std::cerr << "[AuditLog] append failed: " << e.what() << "\n";
      pending->done.set_exception(
          std::make_exception_ptr(PersistenceError(e.what())));
    }
  }
}

AuditReceipt AuditLog::write(const std::string& kind,
                             const nlohmann::json& data) {
  domain::AuditEntry entry;
  {
    std::shared_lock lock(entries_mutex_);
    entry.sequence = entries_.empty() ? 1 : entries_.back().sequence + 1;
    entry.previous_hash =
        entries_.empty() ? genesisHash() : entries_.back().entry_hash;
  }
  entry.kind = kind;
  entry.timestamp_ms = clock_.now_ms();
  entry.payload = canonicalPayload(entry.sequence, kind, entry.timestamp_ms, data);
  entry.entry_hash = sha256Hex(entry.previous_hash + entry.payload);

  if (file_.is_open()) {
    nlohmann::json line{{"sequence", entry.sequence},
                        {"kind", entry.kind},
                        {"timestamp_ms", entry.timestamp_ms},
                        {"previous_hash", entry.previous_hash},
                        {"payload", entry.payload},
                        {"entry_hash", entry.entry_hash}};
    file_ << line.dump() << '\n';
    file_.flush();
    if (!file_) {
      throw PersistenceError("write to " + path_ + " failed");
    }
  }

  AuditReceipt receipt{entry.sequence, entry.entry_hash};
  std::unique_lock lock(entries_mutex_);
  entries_.push_back(std::move(entry));
  return receipt;
}

// -----------------------------------------------------------------------------
// verifyEntries(): recompute every link from genesis
// -----------------------------------------------------------------------------
ChainVerification AuditLog::verifyEntries(
    const std::vector<domain::AuditEntry>& entries) {
  ChainVerification result;
  std::string expected_previous = genesisHash();

  auto fail = [&result](std::size_t index, std::string detail) {
    result.valid = false;
    result.first_invalid_index = index;
    result.detail = std::move(detail);
  };

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const domain::AuditEntry& entry = entries[i];
    result.entries_checked = i + 1;

    if (entry.previous_hash != expected_previous) {
      fail(i, "broken link at sequence " + std::to_string(entry.sequence));
      return result;
    }
    if (sha256Hex(entry.previous_hash + entry.payload) != entry.entry_hash) {
      fail(i, "hash mismatch at sequence " + std::to_string(entry.sequence));
      return result;
    }
    auto payload = nlohmann::json::parse(entry.payload, nullptr, false);
    if (payload.is_discarded() || !payload.is_object() ||
        !payload.contains("seq") || !payload.at("seq").is_number_unsigned() ||
        payload.at("seq").get<std::uint64_t>() != i + 1 ||
        entry.sequence != i + 1) {
      fail(i, "sequence gap at index " + std::to_string(i));
      return result;
    }
    // kind and timestamp_ms sit outside the hashed bytes; recovery branches
    // on kind, so both must repeat what the payload says.
    const auto kind = payload.find("kind");
    const auto ts = payload.find("ts");
    if (kind == payload.end() || !kind->is_string() ||
        kind->get<std::string>() != entry.kind || ts == payload.end() ||
        !ts->is_number_integer() ||
        ts->get<domain::TimestampMs>() != entry.timestamp_ms) {
      fail(i, "header mismatch at sequence " + std::to_string(entry.sequence));
      return result;
    }
    expected_previous = entry.entry_hash;
  }
  return result;
}

ChainVerification AuditLog::verify() const {
  return verifyEntries(entries());
}

std::vector<domain::AuditEntry> AuditLog::entries() const {
  std::shared_lock lock(entries_mutex_);
  return entries_;
}

std::vector<domain::AuditEntry> AuditLog::entriesAfter(
    std::uint64_t sequence) const {
  std::shared_lock lock(entries_mutex_);
  std::vector<domain::AuditEntry> result;
  for (const auto& entry : entries_) {
    if (entry.sequence > sequence) {
      result.push_back(entry);
    }
  }
  return result;
}

std::size_t AuditLog::size() const {
  std::shared_lock lock(entries_mutex_);
  return entries_.size();
}

std::uint64_t AuditLog::lastSequence() const {
  std::shared_lock lock(entries_mutex_);
  return entries_.empty() ? 0 : entries_.back().sequence;
}

std::string AuditLog::lastHash() const {
  std::shared_lock lock(entries_mutex_);
  return entries_.empty() ? genesisHash() : entries_.back().entry_hash;
}

}  // namespace sentinel
