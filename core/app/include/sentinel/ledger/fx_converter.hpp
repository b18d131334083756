#pragma once

#include "sentinel/domain/types.hpp"
#include "sentinel/time/i_time_provider.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace sentinel {

struct FxQuote {
  double rate{0.0};  // units of `to` per unit of `from`
  domain::TimestampMs as_of_ms{0};
};

// -----------------------------------------------------------------------------
// IFxRateProvider — external FX rate source
// -----------------------------------------------------------------------------
//
// @brief  Returns the current rate or std::nullopt if it cannot answer within
//         `timeout`.
//
// FxConverter stops waiting at `timeout` whether or not the provider honours
// it; an overrunning lookup finishes on a worker thread and is discarded, so
// the provider must outlive the converter's last call.
// -----------------------------------------------------------------------------
class IFxRateProvider {
 public:
  virtual ~IFxRateProvider() = default;

  virtual std::optional<FxQuote> lookup(const std::string& from,
                                        const std::string& to,
                                        std::chrono::milliseconds timeout) = 0;
};

// -----------------------------------------------------------------------------
// StaticFxRateProvider
// -----------------------------------------------------------------------------
// Rates set in config or by tests. Answers the inverse pair when only one
// direction is stored. setAvailable(false) simulates an outage.
// -----------------------------------------------------------------------------
class StaticFxRateProvider final : public IFxRateProvider {
 public:
  void setRate(const std::string& from, const std::string& to, double rate,
               domain::TimestampMs as_of_ms);
  void setAvailable(bool available);

  std::optional<FxQuote> lookup(const std::string& from, const std::string& to,
                                std::chrono::milliseconds timeout) override;

 private:
  std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, FxQuote> rates_;
  bool available_{true};
};

struct FxConfig {
  std::chrono::milliseconds lookup_timeout{250};
  std::int64_t max_stale_ms{5 * 60 * 1000};
};

// Result of a conversion. ok == false means no usable rate at all.
struct FxConversion {
  bool ok{false};
  double value{0.0};
  double rate{0.0};
  bool stale{false};
};

// -----------------------------------------------------------------------------
// FxConverter
// -----------------------------------------------------------------------------
//
// @brief  Converts amounts into the engine base currency.
//
// @details
// Every call asks the provider first; the answer is never cached as a
// substitute for asking. When the provider fails or times out, the last
// known rate is used and the result is flagged stale. The wait on the
// provider is capped at lookup_timeout. A last-known rate
// older than max_stale_ms is not used and the conversion fails.
//
// Thread-safety: safe from any thread; the last-known table is guarded.
// -----------------------------------------------------------------------------
class FxConverter {
 public:
  FxConverter(IFxRateProvider& provider, const ITimeProvider& clock,
              std::string base_currency, FxConfig config);

  FxConverter(const FxConverter&) = delete;
  FxConverter& operator=(const FxConverter&) = delete;

  FxConversion rate(const std::string& from);
  FxConversion toBase(double amount, const std::string& from);

  const std::string& baseCurrency() const { return base_currency_; }

 private:
  IFxRateProvider& provider_;
  const ITimeProvider& clock_;
  std::string base_currency_;
  FxConfig config_;

  std::mutex mutex_;
  std::unordered_map<std::string, FxQuote> last_known_;
};

}  // namespace sentinel
