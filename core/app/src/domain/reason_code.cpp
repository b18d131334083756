#include "sentinel/domain/reason_code.hpp"

#include <array>
#include <utility>

namespace sentinel {
namespace domain {

namespace {

using R = ReasonCode;

// Stable wire names. Order matches the enum declaration.
constexpr std::array<std::pair<ReasonCode, const char*>, 29> kReasonNames{{
    {R::None, "NONE"},
    {R::InvalidIntent, "INVALID_INTENT"},
    {R::InvalidConfig, "INVALID_CONFIG"},
    {R::UnknownStrategy, "UNKNOWN_STRATEGY"},
    {R::StrategyDisabled, "STRATEGY_DISABLED"},
    {R::SymbolNotAllowed, "SYMBOL_NOT_ALLOWED"},
    {R::UnknownVenue, "UNKNOWN_VENUE"},
    {R::NoMarketData, "NO_MARKET_DATA"},
    {R::DuplicateIntent, "DUPLICATE_INTENT"},
    {R::EvBelowThreshold, "EV_BELOW_THRESHOLD"},
    {R::KillSwitchActive, "KILL_SWITCH_ACTIVE"},
    {R::TradeNotionalLimit, "TRADE_NOTIONAL_LIMIT"},
    {R::SymbolNotionalLimit, "SYMBOL_NOTIONAL_LIMIT"},
    {R::GrossNotionalLimit, "GROSS_NOTIONAL_LIMIT"},
    {R::StrategyNotionalLimit, "STRATEGY_NOTIONAL_LIMIT"},
    {R::DailyLossLimit, "DAILY_LOSS_LIMIT"},
    {R::OutsideTradingHours, "OUTSIDE_TRADING_HOURS"},
    {R::VenueDown, "VENUE_DOWN"},
    {R::VenueTimeout, "VENUE_TIMEOUT"},
    {R::VenueRejected, "VENUE_REJECTED"},
    {R::InsufficientLiquidity, "INSUFFICIENT_LIQUIDITY"},
    {R::CanceledByRequest, "CANCELED_BY_REQUEST"},
    {R::CanceledByKillSwitch, "CANCELED_BY_KILL_SWITCH"},
    {R::CanceledOnRecovery, "CANCELED_ON_RECOVERY"},
    {R::ReconciliationMismatch, "RECONCILIATION_MISMATCH"},
    {R::ChainIntegrityFailure, "CHAIN_INTEGRITY_FAILURE"},
    {R::PersistenceFailure, "PERSISTENCE_FAILURE"},
    {R::EngineNotReady, "ENGINE_NOT_READY"},
    {R::PipelineBusy, "PIPELINE_BUSY"},
}};

}  // namespace

const char* toString(ReasonCode code) {
  for (const auto& [value, name] : kReasonNames) {
    if (value == code) {
      return name;
    }
  }
  return "UNKNOWN";
}

std::optional<ReasonCode> reasonFromString(const std::string& text) {
  for (const auto& [value, name] : kReasonNames) {
    if (text == name) {
      return value;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// categoryOf: map each reason onto the error taxonomy
// -----------------------------------------------------------------------------
ErrorCategory categoryOf(ReasonCode code) {
  switch (code) {
    case R::None:
    case R::CanceledByRequest:
      return ErrorCategory::None;

    case R::InvalidIntent:
    case R::InvalidConfig:
    case R::UnknownStrategy:
    case R::StrategyDisabled:
    case R::SymbolNotAllowed:
    case R::UnknownVenue:
    case R::NoMarketData:
    case R::DuplicateIntent:
      return ErrorCategory::Validation;

    case R::EvBelowThreshold:
      return ErrorCategory::EvRejection;

    case R::KillSwitchActive:
    case R::TradeNotionalLimit:
    case R::SymbolNotionalLimit:
    case R::GrossNotionalLimit:
    case R::StrategyNotionalLimit:
    case R::DailyLossLimit:
    case R::OutsideTradingHours:
    case R::CanceledByKillSwitch:
      return ErrorCategory::LimitBreach;

    case R::VenueDown:
    case R::VenueTimeout:
    case R::VenueRejected:
    case R::InsufficientLiquidity:
    case R::CanceledOnRecovery:
      return ErrorCategory::Venue;

    case R::ReconciliationMismatch:
      return ErrorCategory::ReconciliationMismatch;

    case R::ChainIntegrityFailure:
    case R::PersistenceFailure:
      return ErrorCategory::ChainIntegrity;

    case R::EngineNotReady:
    case R::PipelineBusy:
      return ErrorCategory::Unavailable;
  }
  return ErrorCategory::None;
}

const char* toString(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::None:                   return "NONE";
    case ErrorCategory::Validation:             return "VALIDATION";
    case ErrorCategory::EvRejection:            return "EV_REJECTION";
    case ErrorCategory::LimitBreach:            return "LIMIT_BREACH";
    case ErrorCategory::Venue:                  return "VENUE";
    case ErrorCategory::ReconciliationMismatch: return "RECONCILIATION_MISMATCH";
    case ErrorCategory::ChainIntegrity:         return "CHAIN_INTEGRITY";
    case ErrorCategory::Unavailable:            return "UNAVAILABLE";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace sentinel
