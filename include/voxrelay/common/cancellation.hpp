#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace voxrelay::common {

class CancellationSource;

/// Read side of a cancellation flag. A default-constructed token is never cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] bool cancelled() const;

  /// Sleeps up to `timeout`; returns true as soon as cancellation is observed.
  bool wait_for(std::chrono::milliseconds timeout) const;

private:
  friend class CancellationSource;

  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
  };

  explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
};

class CancellationSource {
public:
  CancellationSource();

  /// Idempotent. Wakes every waiter.
  void cancel();
  [[nodiscard]] bool cancelled() const;
  [[nodiscard]] CancellationToken token() const;

private:
  std::shared_ptr<CancellationToken::State> state_;
};

} // namespace voxrelay::common
