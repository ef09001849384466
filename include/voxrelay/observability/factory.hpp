#pragma once

#include "voxrelay/config/schema.hpp"
#include "voxrelay/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace voxrelay::observability {

/// Discards everything. Installed when `observability.backend` is "noop" or "none".
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

/// Relays turn, session and queue telemetry to several backends in the order they
/// were added. The backend list is fixed before the observer is installed, after
/// which turn workers and event forwarders may record concurrently.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  /// e.g. "log,noop"
  [[nodiscard]] std::string backend_names() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

/// Builds the observer named by `observability.backend`: "log", "noop", or a comma
/// list such as "log, noop". Repeated names in a list are added once; unknown names
/// are skipped. A single unknown name falls back to "log".
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace voxrelay::observability
