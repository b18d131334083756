#pragma once

#include <optional>
#include <string>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorCategory
// -----------------------------------------------------------------------------
//
// @brief  Coarse classification of every failure the engine can report.
//
// @details
//   Validation              malformed intent, unknown strategy/venue/symbol.
//   EvRejection             the EV gate found no profitable size.
//   LimitBreach             a pre-trade limit or the kill switch denied it.
//   Venue                   venue down, timeout, rejected, thin book.
//   ReconciliationMismatch  internal fills disagree with the venue.
//   ChainIntegrity          the audit chain failed verification or could
//                           not be extended. Fatal to intent intake.
//   Unavailable             engine not started or pipeline saturated.
// -----------------------------------------------------------------------------
enum class ErrorCategory {
  None,
  Validation,
  EvRejection,
  LimitBreach,
  Venue,
  ReconciliationMismatch,
  ChainIntegrity,
  Unavailable,
};

// -----------------------------------------------------------------------------
// ReasonCode
// -----------------------------------------------------------------------------
//
// @brief  Machine-readable reason attached to every decision, denial, order
//         transition and audit entry.
//
// @details
// The string form (toString) is what lands in the audit log and on the wire;
// it must stay stable across releases because recovery parses it back.
// -----------------------------------------------------------------------------
enum class ReasonCode {
  None,
  // Validation
  InvalidIntent,
  InvalidConfig,
  UnknownStrategy,
  StrategyDisabled,
  SymbolNotAllowed,
  UnknownVenue,
  NoMarketData,
  DuplicateIntent,
  // EV gate
  EvBelowThreshold,
  // Limits
  KillSwitchActive,
  TradeNotionalLimit,
  SymbolNotionalLimit,
  GrossNotionalLimit,
  StrategyNotionalLimit,
  DailyLossLimit,
  OutsideTradingHours,
  // Venue
  VenueDown,
  VenueTimeout,
  VenueRejected,
  InsufficientLiquidity,
  // Order terminal reasons
  CanceledByRequest,
  CanceledByKillSwitch,
  CanceledOnRecovery,
  // Reconciliation / integrity
  ReconciliationMismatch,
  ChainIntegrityFailure,
  PersistenceFailure,
  // Availability
  EngineNotReady,
  PipelineBusy,
};

const char* toString(ReasonCode code);
std::optional<ReasonCode> reasonFromString(const std::string& text);
ErrorCategory categoryOf(ReasonCode code);
const char* toString(ErrorCategory category);

}  // namespace domain
}  // namespace sentinel
