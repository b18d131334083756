#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sentinel {
namespace domain {

// -----------------------------------------------------------------------------
// Scalar aliases shared by every domain struct.
// -----------------------------------------------------------------------------
// OrderId is engine-assigned and starts at 1 (0 means "unset").
// TimestampMs is milliseconds since the Unix epoch, UTC. Every component reads
// time through ITimeProvider so simulated and live runs produce the same values.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;
using TimestampMs = std::int64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

// +1 for Buy, -1 for Sell. Used wherever a quantity becomes signed.
inline double sideSign(Side side) { return side == Side::Buy ? 1.0 : -1.0; }

inline const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

inline std::optional<Side> sideFromString(const std::string& text) {
  if (text == "BUY" || text == "Buy" || text == "buy") return Side::Buy;
  if (text == "SELL" || text == "Sell" || text == "sell") return Side::Sell;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Liquidity
// -----------------------------------------------------------------------------
// Whether an execution adds (Maker) or removes (Taker) resting liquidity.
// Selects the fee rate in FeeTaxModel.
// -----------------------------------------------------------------------------
enum class Liquidity {
  Maker,
  Taker,
};

inline const char* toString(Liquidity liquidity) {
  switch (liquidity) {
    case Liquidity::Maker: return "MAKER";
    case Liquidity::Taker: return "TAKER";
  }
  return "UNKNOWN";
}

inline std::optional<Liquidity> liquidityFromString(const std::string& text) {
  if (text == "MAKER" || text == "maker") return Liquidity::Maker;
  if (text == "TAKER" || text == "taker") return Liquidity::Taker;
  return std::nullopt;
}

}  // namespace domain
}  // namespace sentinel
