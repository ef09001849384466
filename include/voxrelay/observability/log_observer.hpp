#pragma once

#include "voxrelay/observability/observer.hpp"

#include <iostream>
#include <mutex>
#include <optional>

namespace voxrelay::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

/// Writes one "[LEVEL] message" line per event to a stream (stderr by default).
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info, std::ostream &out = std::cerr);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace voxrelay::observability
