#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace sentinel {

class CancellationSource;

// -----------------------------------------------------------------------------
// CancellationToken
// -----------------------------------------------------------------------------
//
// @brief  Read side of a cancellation flag. Cheap to copy; all copies observe
//         the same source.
//
// @details
// Long-running work (slice loops in a venue, retry loops, deadline waits)
// polls cancelled() between steps. A default-constructed token is never
// cancelled.
// -----------------------------------------------------------------------------
class CancellationToken {
 public:
  CancellationToken() = default;

  bool cancelled() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
      : flag_(std::move(flag)) {}

  std::shared_ptr<const std::atomic<bool>> flag_;
};

// -----------------------------------------------------------------------------
// CancellationSource
// -----------------------------------------------------------------------------
// Write side. cancel() is idempotent and visible to every token issued before
// or after the call.
// -----------------------------------------------------------------------------
class CancellationSource {
 public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  CancellationToken token() const { return CancellationToken(flag_); }

  void cancel() { flag_->store(true, std::memory_order_release); }

  bool cancelled() const { return flag_->load(std::memory_order_acquire); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace sentinel
