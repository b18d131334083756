#pragma once

#include "sentinel/domain/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace sentinel {
namespace domain {

// A trade as reported by the venue's own history.
struct ExternalTrade {
  std::string trade_id;
  std::string symbol;
  Side side{Side::Buy};
  double price{0.0};
  double quantity{0.0};
  TimestampMs timestamp_ms{0};
};

enum class DiscrepancyKind {
  MissingExternal,  // we recorded it, the venue did not
  MissingInternal,  // the venue reports it, we have no record
  PriceMismatch,
  QuantityMismatch,
  SideMismatch,
};

inline const char* toString(DiscrepancyKind kind) {
  switch (kind) {
    case DiscrepancyKind::MissingExternal:  return "MISSING_EXTERNAL";
    case DiscrepancyKind::MissingInternal:  return "MISSING_INTERNAL";
    case DiscrepancyKind::PriceMismatch:    return "PRICE_MISMATCH";
    case DiscrepancyKind::QuantityMismatch: return "QUANTITY_MISMATCH";
    case DiscrepancyKind::SideMismatch:     return "SIDE_MISMATCH";
  }
  return "UNKNOWN";
}

struct Discrepancy {
  std::string trade_id;
  DiscrepancyKind kind{DiscrepancyKind::MissingExternal};
  double internal_value{0.0};
  double external_value{0.0};
};

// -----------------------------------------------------------------------------
// ReconciliationReport
// -----------------------------------------------------------------------------
// passed() is true only with zero discrepancies. Any discrepancy, including a
// trade missing on either side, is a failure.
// -----------------------------------------------------------------------------
struct ReconciliationReport {
  TimestampMs timestamp_ms{0};
  std::size_t internal_count{0};
  std::size_t external_count{0};
  std::size_t matched_count{0};
  std::vector<Discrepancy> discrepancies;

  bool passed() const { return discrepancies.empty(); }
};

}  // namespace domain
}  // namespace sentinel
