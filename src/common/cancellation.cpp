#include "voxrelay/common/cancellation.hpp"

#include <thread>

namespace voxrelay::common {

bool CancellationToken::cancelled() const {
  return state_ != nullptr && state_->cancelled.load();
}

bool CancellationToken::wait_for(const std::chrono::milliseconds timeout) const {
  if (state_ == nullptr) {
    std::this_thread::sleep_for(timeout);
    return false;
  }
  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled.load(); });
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::cancel() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled.store(true);
  }
  state_->cv.notify_all();
}

bool CancellationSource::cancelled() const { return state_->cancelled.load(); }

CancellationToken CancellationSource::token() const { return CancellationToken(state_); }

} // namespace voxrelay::common
