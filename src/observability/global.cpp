#include "voxrelay/observability/global.hpp"

#include <mutex>

namespace voxrelay::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_turn_rejected(const std::string &session_id, const std::string &reason) {
  record_event(TurnRejectedEvent{.session_id = session_id, .reason = reason});
}

void record_active_sessions(const std::uint64_t count) {
  record_metric(ActiveSessionsMetric{.count = count});
}

} // namespace voxrelay::observability
