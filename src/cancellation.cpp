#include <stylefix/cancellation.h>

namespace stylefix {

CancellationSource::CancellationSource()
    : flag_(std::make_shared<std::atomic_bool>(false)) {}

void CancellationSource::Cancel() {
  flag_->store(true, std::memory_order_release);
}

bool CancellationSource::IsCancellationRequested() const {
  return flag_->load(std::memory_order_acquire);
}

CancellationToken CancellationSource::Token() const {
  return CancellationToken(flag_);
}

} // namespace stylefix
