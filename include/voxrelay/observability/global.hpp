#pragma once

#include "voxrelay/observability/observer.hpp"

#include <memory>

namespace voxrelay::observability {

/// Process-wide observer used by every component. Passing nullptr disables recording.
void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_error(const std::string &component, const std::string &message);
void record_turn_rejected(const std::string &session_id, const std::string &reason);
void record_active_sessions(std::uint64_t count);

} // namespace voxrelay::observability
