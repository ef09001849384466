#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace voxrelay::observability {

struct SessionStartEvent {
  std::string session_id;
  std::string peer;
};

struct SessionEndEvent {
  std::string session_id;
  std::chrono::milliseconds duration{0};
};

struct TurnStartEvent {
  std::string session_id;
  std::uint64_t turn_id = 0;
};

struct TurnEndEvent {
  std::string session_id;
  std::uint64_t turn_id = 0;
  std::string outcome;
  std::string reason;
  std::size_t fragments = 0;
  std::chrono::milliseconds duration{0};
};

/// An utterance that did not become a turn (empty, or dropped while busy).
struct TurnRejectedEvent {
  std::string session_id;
  std::string reason;
};

struct GenerationFailureEvent {
  std::string session_id;
  std::uint64_t turn_id = 0;
  std::size_t fragments_forwarded = 0;
  std::string message;
};

struct EventDroppedEvent {
  std::string session_id;
  std::string kind;
  std::uint64_t dropped_total = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SessionStartEvent, SessionEndEvent, TurnStartEvent, TurnEndEvent,
                 TurnRejectedEvent, GenerationFailureEvent, EventDroppedEvent, ErrorEvent>;

struct FirstFragmentLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

struct QueueDepthMetric {
  std::uint64_t depth = 0;
};

using ObserverMetric = std::variant<FirstFragmentLatencyMetric, ActiveSessionsMetric,
                                    QueueDepthMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace voxrelay::observability
