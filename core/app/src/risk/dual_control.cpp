#include "sentinel/risk/dual_control.hpp"
#include "sentinel/audit/digest.hpp"

#include <algorithm>
#include <utility>

namespace sentinel {

DualControl::DualControl(std::vector<OperatorCredential> operators,
                         std::size_t required)
    : operators_(std::move(operators)), required_(std::max<std::size_t>(required, 1)) {}

DualControlResult DualControl::verify(const DualControlRequest& request) const {
  DualControlResult result;

  for (const auto& confirmation : request.confirmations) {
    if (std::find(result.operators.begin(), result.operators.end(),
                  confirmation.operator_id) != result.operators.end()) {
      continue;
    }
    auto it = std::find_if(operators_.begin(), operators_.end(),
                           [&](const OperatorCredential& c) {
                             return c.operator_id == confirmation.operator_id;
                           });
    if (it == operators_.end()) {
      continue;
    }
    if (digestEquals(sha256Hex(confirmation.secret), it->secret_sha256)) {
      result.operators.push_back(confirmation.operator_id);
    }
  }

  result.approved = result.operators.size() >= required_;
  if (!result.approved) {
    result.detail = "need " + std::to_string(required_) +
                    " distinct operator confirmations, got " +
                    std::to_string(result.operators.size());
  }
  return result;
}

}  // namespace sentinel
