#include "sentinel/ledger/fx_converter.hpp"

#include "sentinel/concurrent/bounded_call.hpp"

#include <exception>
#include <iostream>

namespace sentinel {

// -----------------------------------------------------------------------------
// StaticFxRateProvider
// -----------------------------------------------------------------------------
void StaticFxRateProvider::setRate(const std::string& from,
                                   const std::string& to, double rate,
                                   domain::TimestampMs as_of_ms) {
  std::lock_guard lock(mutex_);
  rates_[{from, to}] = FxQuote{rate, as_of_ms};
}

void StaticFxRateProvider::setAvailable(bool available) {
  std::lock_guard lock(mutex_);
  available_ = available;
}

std::optional<FxQuote> StaticFxRateProvider::lookup(
    const std::string& from, const std::string& to,
    std::chrono::milliseconds /*timeout*/) {
  std::lock_guard lock(mutex_);
  if (!available_) {
    return std::nullopt;
  }
  if (auto it = rates_.find({from, to}); it != rates_.end()) {
    return it->second;
  }
  if (auto it = rates_.find({to, from});
      it != rates_.end() && it->second.rate > 0.0) {
    return FxQuote{1.0 / it->second.rate, it->second.as_of_ms};
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// FxConverter
// -----------------------------------------------------------------------------
FxConverter::FxConverter(IFxRateProvider& provider, const ITimeProvider& clock,
                         std::string base_currency, FxConfig config)
    : provider_(provider),
      clock_(clock),
      base_currency_(std::move(base_currency)),
      config_(config) {}

FxConversion FxConverter::rate(const std::string& from) {
  if (from.empty() || from == base_currency_) {
    return FxConversion{true, 1.0, 1.0, false};
  }

  std::optional<FxQuote> quote;
  try {
    auto answered = callWithDeadline<std::optional<FxQuote>>(
        [provider = &provider_, from, to = base_currency_,
         timeout = config_.lookup_timeout] {
          return provider->lookup(from, to, timeout);
        },
        config_.lookup_timeout);
    if (!answered) {
      std::cerr << "[FxConverter] " << from << "/" << base_currency_
                << " lookup exceeded " << config_.lookup_timeout.count()
                << " ms\n";
    } else {
      quote = *answered;
    }
  } catch (const std::exception& e) {
    std::cerr << "[FxConverter] " << from << "/" << base_currency_
              << " lookup failed: " << e.what() << "\n";
  }

  if (quote && quote->rate > 0.0) {
    std::lock_guard lock(mutex_);
    last_known_[from] = *quote;
    return FxConversion{true, quote->rate, quote->rate, false};
  }

  std::lock_guard lock(mutex_);
  auto it = last_known_.find(from);
  if (it == last_known_.end()) {
    std::cerr << "[FxConverter] no rate for " << from << "/"
              << base_currency_ << "\n";
    return FxConversion{};
  }
  std::int64_t age = clock_.now_ms() - it->second.as_of_ms;
  if (age > config_.max_stale_ms) {
    std::cerr << "[FxConverter] last known " << from << "/" << base_currency_
              << " rate is " << age << " ms old; refusing to use it\n";
    return FxConversion{};
  }
  return FxConversion{true, it->second.rate, it->second.rate, true};
}

FxConversion FxConverter::toBase(double amount, const std::string& from) {
  FxConversion conversion = rate(from);
  if (conversion.ok) {
    conversion.value = amount * conversion.rate;
  }
  return conversion;
}

}  // namespace sentinel
