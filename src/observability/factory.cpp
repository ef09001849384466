#include "voxrelay/observability/factory.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/observability/log_observer.hpp"

#include <algorithm>
#include <sstream>

namespace voxrelay::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const std::string &backend, const LogLevel level) {
  if (backend == "log") {
    return std::make_unique<LogObserver>(level);
  }
  if (backend == "noop" || backend == "none") {
    return std::make_unique<NoopObserver>();
  }
  return nullptr;
}

} // namespace

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    observers_.push_back(std::move(observer));
  }
}

std::string MultiObserver::backend_names() const {
  std::string names;
  for (const auto &observer : observers_) {
    if (!names.empty()) {
      names += ",";
    }
    names += observer->name();
  }
  return names;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const LogLevel level =
      parse_log_level(config.observability.log_level).value_or(LogLevel::Info);
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') == std::string::npos) {
    if (auto single = make_backend(backend, level); single != nullptr) {
      return single;
    }
    return std::make_unique<LogObserver>(level);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::vector<std::string> seen;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    std::string name = common::trim(part);
    if (name == "none") {
      name = "noop";
    }
    if (name.empty() || std::find(seen.begin(), seen.end(), name) != seen.end()) {
      continue;
    }
    if (auto observer = make_backend(name, level); observer != nullptr) {
      seen.push_back(name);
      multi->add(std::move(observer));
    }
  }
  return multi;
}

} // namespace voxrelay::observability
