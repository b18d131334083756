#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sentinel {

// An operator allowed to confirm privileged actions. The secret itself is
// never stored; only its SHA-256 hex digest.
struct OperatorCredential {
  std::string operator_id;
  std::string secret_sha256;
};

struct OperatorConfirmation {
  std::string operator_id;
  std::string secret;
};

struct DualControlRequest {
  std::vector<OperatorConfirmation> confirmations;
  std::string reason;
};

struct DualControlResult {
  bool approved{false};
  std::vector<std::string> operators;  // distinct, verified
  std::string detail;
};

// -----------------------------------------------------------------------------
// DualControl — two-person rule for kill-switch actions
// -----------------------------------------------------------------------------
//
// @brief  Approves a request only when at least `required` distinct
//         configured operators supplied a matching secret.
//
// @details
// Unknown operators, wrong secrets and repeated operator ids do not count.
// Digests are compared in constant time.
//
// Thread-safety: immutable after construction; verify() is const.
// -----------------------------------------------------------------------------
class DualControl {
 public:
  explicit DualControl(std::vector<OperatorCredential> operators,
                       std::size_t required = 2);

  DualControlResult verify(const DualControlRequest& request) const;

  std::size_t required() const { return required_; }
  std::size_t operatorCount() const { return operators_.size(); }

 private:
  std::vector<OperatorCredential> operators_;
  std::size_t required_;
};

}  // namespace sentinel
