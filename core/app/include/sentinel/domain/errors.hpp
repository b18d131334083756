#pragma once

#include "sentinel/domain/reason_code.hpp"

#include <stdexcept>
#include <string>

namespace sentinel {

// -----------------------------------------------------------------------------
// Exception hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Exceptions are reserved for conditions the caller cannot handle
//         inline: bad configuration at startup, a broken audit chain, or a
//         storage failure. Everything on the intent path (EV rejection, limit
//         denial, venue reject) is reported as a value with a ReasonCode.
//
// @details
//   EngineError          base; carries the ReasonCode for logs/responses.
//   ConfigError          thrown by the config loader; process should exit.
//   ChainIntegrityError  verification failed; intake stays closed until an
//                        operator intervenes.
//   PersistenceError     audit or snapshot I/O failed.
// -----------------------------------------------------------------------------
class EngineError : public std::runtime_error {
 public:
  EngineError(domain::ReasonCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  domain::ReasonCode code() const noexcept { return code_; }

 private:
  domain::ReasonCode code_;
};

class ConfigError : public EngineError {
 public:
  explicit ConfigError(const std::string& message)
      : EngineError(domain::ReasonCode::InvalidConfig, "config: " + message) {}
};

class ChainIntegrityError : public EngineError {
 public:
  explicit ChainIntegrityError(const std::string& message)
      : EngineError(domain::ReasonCode::ChainIntegrityFailure, message) {}
};

class PersistenceError : public EngineError {
 public:
  explicit PersistenceError(const std::string& message)
      : EngineError(domain::ReasonCode::PersistenceFailure, message) {}
};

}  // namespace sentinel
