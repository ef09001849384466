#pragma once

#include "voxrelay/common/result.hpp"
#include "voxrelay/events/enricher.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace voxrelay::events {

/// The urgent out-of-band message channel offered by the transport. Implementations
/// deliver one complete event per call, framed separately from audio.
class IEventChannel {
public:
  virtual ~IEventChannel() = default;
  [[nodiscard]] virtual common::Status send_urgent(const OutboundEvent &event) = 0;
};

/// Anything that raises UI/telemetry events. Publishing never blocks on the client.
class IEventPublisher {
public:
  virtual ~IEventPublisher() = default;
  virtual void publish(OutboundEvent event) = 0;
};

struct EventForwarderOptions {
  std::size_t queue_capacity = 256;
  std::string session_id;
};

/// Streaming text events (bot-llm-text, bot-tts-text) may be shed under backpressure.
/// Turn boundaries, transcriptions, bot-ready and errors never are.
[[nodiscard]] bool is_sheddable(EventKind kind);

/// Enriches events on the publishing thread, queues them, and hands them to the
/// channel from a dedicated delivery thread. When the queue is full the oldest
/// sheddable event is dropped; if none is queued, a sheddable newcomer is dropped
/// instead and any other newcomer is queued past capacity.
class EventForwarder final : public IEventPublisher {
public:
  EventForwarder(std::shared_ptr<IEventEnricher> enricher, IEventChannel &channel,
                 EventForwarderOptions options = {});
  ~EventForwarder() override;

  EventForwarder(const EventForwarder &) = delete;
  EventForwarder &operator=(const EventForwarder &) = delete;

  void start();
  /// Delivers everything already queued, then stops the delivery thread.
  void stop();

  void publish(OutboundEvent event) override;

  [[nodiscard]] std::uint64_t dropped_count() const { return dropped_.load(); }
  [[nodiscard]] std::uint64_t delivered_count() const { return delivered_.load(); }
  [[nodiscard]] std::size_t queue_depth() const;
  [[nodiscard]] bool is_running() const { return running_.load(); }

private:
  void delivery_loop();

  std::shared_ptr<IEventEnricher> enricher_;
  IEventChannel &channel_;
  EventForwarderOptions options_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<OutboundEvent> queue_;
  bool stopping_ = false;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> delivered_{0};
  std::thread worker_;
};

} // namespace voxrelay::events
