#include "voxrelay/observability/log_observer.hpp"

#include "voxrelay/common/fs.hpp"

#include <type_traits>

namespace voxrelay::observability {

namespace {

const char *level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string session_tag(const std::string &session_id) {
  return session_id.empty() ? std::string("session=-") : "session=" + session_id;
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string_view text) {
  const std::string normalized = common::to_lower(common::trim(std::string(text)));
  if (normalized == "debug" || normalized == "trace") {
    return LogLevel::Debug;
  }
  if (normalized == "info" || normalized.empty()) {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionStartEvent>) {
          log_line(LogLevel::Info, "session.start " + session_tag(evt.session_id) +
                                       " peer=" + evt.peer);
        } else if constexpr (std::is_same_v<T, SessionEndEvent>) {
          log_line(LogLevel::Info, "session.end " + session_tag(evt.session_id) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, TurnStartEvent>) {
          log_line(LogLevel::Debug, "turn.start " + session_tag(evt.session_id) +
                                        " turn=" + std::to_string(evt.turn_id));
        } else if constexpr (std::is_same_v<T, TurnEndEvent>) {
          std::string line = "turn.end " + session_tag(evt.session_id) +
                             " turn=" + std::to_string(evt.turn_id) + " outcome=" + evt.outcome;
          if (!evt.reason.empty()) {
            line += " reason=" + evt.reason;
          }
          line += " fragments=" + std::to_string(evt.fragments) +
                  " duration_ms=" + std::to_string(evt.duration.count());
          log_line(LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, TurnRejectedEvent>) {
          log_line(LogLevel::Info,
                   "turn.rejected " + session_tag(evt.session_id) + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, GenerationFailureEvent>) {
          // A truncated response still reached the caller; only an empty one is an error.
          const LogLevel level =
              evt.fragments_forwarded == 0 ? LogLevel::Error : LogLevel::Warn;
          log_line(level, "generation.failure " + session_tag(evt.session_id) +
                              " turn=" + std::to_string(evt.turn_id) +
                              " fragments=" + std::to_string(evt.fragments_forwarded) + ": " +
                              evt.message);
        } else if constexpr (std::is_same_v<T, EventDroppedEvent>) {
          log_line(LogLevel::Warn, "events.dropped " + session_tag(evt.session_id) +
                                       " kind=" + evt.kind +
                                       " total=" + std::to_string(evt.dropped_total));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, FirstFragmentLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.first_fragment_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, QueueDepthMetric>) {
          log_line(LogLevel::Debug, "metric.event_queue_depth=" + std::to_string(m.depth));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace voxrelay::observability
