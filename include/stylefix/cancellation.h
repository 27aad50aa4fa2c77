#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace stylefix {

// Cooperative cancellation. Copies observe the same flag; a
// default-constructed token can never be cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  bool IsCancellationRequested() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }
  bool CanBeCancelled() const { return flag_ != nullptr; }

  static CancellationToken None() { return CancellationToken(); }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<std::atomic_bool> flag)
      : flag_(std::move(flag)) {}

  std::shared_ptr<std::atomic_bool> flag_;
};

class CancellationSource {
public:
  CancellationSource();

  void Cancel();
  bool IsCancellationRequested() const;
  CancellationToken Token() const;

private:
  std::shared_ptr<std::atomic_bool> flag_;
};

} // namespace stylefix
