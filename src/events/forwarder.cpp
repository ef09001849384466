#include "voxrelay/events/forwarder.hpp"

#include "voxrelay/observability/global.hpp"

#include <algorithm>

namespace voxrelay::events {

bool is_sheddable(const EventKind kind) {
  return kind == EventKind::BotLlmText || kind == EventKind::BotTtsText;
}

EventForwarder::EventForwarder(std::shared_ptr<IEventEnricher> enricher, IEventChannel &channel,
                               EventForwarderOptions options)
    : enricher_(std::move(enricher)), channel_(channel), options_(std::move(options)) {
  if (options_.queue_capacity == 0) {
    options_.queue_capacity = 1;
  }
}

EventForwarder::~EventForwarder() { stop(); }

void EventForwarder::start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }
  worker_ = std::thread([this] { delivery_loop(); });
}

void EventForwarder::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  running_ = false;
}

void EventForwarder::publish(OutboundEvent event) {
  OutboundEvent enriched = enricher_ != nullptr ? enricher_->enrich(std::move(event))
                                                : std::move(event);
  std::string dropped_kind;
  std::size_t depth = 0;
  bool queued = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= options_.queue_capacity) {
      const auto victim = std::find_if(queue_.begin(), queue_.end(),
                                       [](const OutboundEvent &e) { return is_sheddable(e.kind); });
      if (victim != queue_.end()) {
        dropped_kind = std::string(event_kind_name(victim->kind));
        queue_.erase(victim);
        ++dropped_;
      } else if (is_sheddable(enriched.kind)) {
        dropped_kind = std::string(event_kind_name(enriched.kind));
        queued = false;
        ++dropped_;
      }
      // Otherwise the queue holds only lifecycle events and grows past capacity.
    }
    if (queued) {
      queue_.push_back(std::move(enriched));
    }
    depth = queue_.size();
  }
  if (queued) {
    cv_.notify_one();
  }

  if (!dropped_kind.empty()) {
    observability::record_event(observability::EventDroppedEvent{
        .session_id = options_.session_id, .kind = dropped_kind, .dropped_total = dropped_.load()});
  }
  if (depth * 2 > options_.queue_capacity) {
    observability::record_metric(observability::QueueDepthMetric{.depth = depth});
  }
}

std::size_t EventForwarder::queue_depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void EventForwarder::delivery_loop() {
  while (true) {
    OutboundEvent next;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      next = std::move(queue_.front());
      queue_.pop_front();
    }

    const auto status = channel_.send_urgent(next);
    if (!status.ok()) {
      observability::record_error("events", "delivery failed for " +
                                                std::string(event_kind_name(next.kind)) + ": " +
                                                status.error());
      continue;
    }
    ++delivered_;
  }
}

} // namespace voxrelay::events
