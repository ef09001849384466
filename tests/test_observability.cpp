#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "voxrelay/observability/factory.hpp"
#include "voxrelay/observability/global.hpp"
#include "voxrelay/observability/log_observer.hpp"

#include <sstream>

void register_observability_tests(std::vector<voxrelay::tests::TestCase> &tests) {
  using voxrelay::tests::require;
  namespace observability = voxrelay::observability;
  namespace testing = voxrelay::testing;

  tests.push_back({"observability_log_format_and_levels", [] {
                     std::ostringstream out;
                     observability::LogObserver observer(observability::LogLevel::Info, out);
                     observer.record_event(observability::SessionStartEvent{.session_id = "s1", .peer = "1.2.3.4"});
                     observer.record_event(observability::TurnStartEvent{.session_id = "s1", .turn_id = 1});
                     observer.record_event(observability::TurnEndEvent{.session_id = "s1",
                                                                       .turn_id = 1,
                                                                       .outcome = "cancelled",
                                                                       .reason = "barge_in",
                                                                       .fragments = 2});
                     observer.record_metric(observability::ActiveSessionsMetric{.count = 1});

                     const std::string text = out.str();
                     require(text.find("[INFO] session.start session=s1 peer=1.2.3.4\n") != std::string::npos,
                             "session start line mismatch: " + text);
                     require(text.find("turn.start") == std::string::npos,
                             "debug lines should be filtered at info");
                     require(text.find("[INFO] turn.end session=s1 turn=1 outcome=cancelled reason=barge_in "
                                       "fragments=2 duration_ms=0") != std::string::npos,
                             "turn end line mismatch: " + text);
                     require(text.find("metric.") == std::string::npos, "metrics are debug level");
                   }});

  tests.push_back({"observability_generation_failure_severity", [] {
                     std::ostringstream out;
                     observability::LogObserver observer(observability::LogLevel::Debug, out);
                     observer.record_event(observability::GenerationFailureEvent{
                         .session_id = "s1", .turn_id = 1, .fragments_forwarded = 0, .message = "down"});
                     observer.record_event(observability::GenerationFailureEvent{
                         .session_id = "", .turn_id = 2, .fragments_forwarded = 3, .message = "cut"});
                     observer.record_event(observability::ErrorEvent{.component = "gateway", .message = "boom"});
                     const std::string text = out.str();
                     require(text.find("[ERROR] generation.failure session=s1 turn=1 fragments=0: down") !=
                                 std::string::npos,
                             "empty failure should be an error: " + text);
                     require(text.find("[WARN] generation.failure session=- turn=2 fragments=3: cut") !=
                                 std::string::npos,
                             "truncated failure should be a warning: " + text);
                     require(text.find("[ERROR] gateway: boom") != std::string::npos, "error line mismatch");
                   }});

  tests.push_back({"observability_parse_log_level", [] {
                     require(observability::parse_log_level("DEBUG") == observability::LogLevel::Debug,
                             "debug should parse");
                     require(observability::parse_log_level("warning") == observability::LogLevel::Warn,
                             "warning alias should parse");
                     require(observability::parse_log_level("") == observability::LogLevel::Info,
                             "empty means info");
                     require(!observability::parse_log_level("chatty").has_value(),
                             "unknown level should not parse");
                   }});

  tests.push_back({"observability_multi_observer_fans_out", [] {
                     observability::MultiObserver multi;
                     auto first = std::make_unique<testing::RecordingObserver>();
                     auto second = std::make_unique<testing::RecordingObserver>();
                     auto *first_ptr = first.get();
                     auto *second_ptr = second.get();
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null observers are skipped");

                     multi.record_event(observability::ErrorEvent{.component = "x", .message = "y"});
                     multi.record_metric(observability::QueueDepthMetric{.depth = 4});
                     require(first_ptr->events().size() == 1 && second_ptr->events().size() == 1,
                             "events should reach every observer");
                     require(first_ptr->metric_count() == 1 && second_ptr->metric_count() == 1,
                             "metrics should reach every observer");
                   }});

  tests.push_back({"observability_factory_backends", [] {
                     auto config = testing::mock_config();
                     require(observability::create_observer(config)->name() == "noop", "noop backend");
                     config.observability.backend = "log";
                     require(observability::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "log, noop";
                     auto multi = observability::create_observer(config);
                     require(multi->name() == "multi", "comma list builds a multi observer");
                     require(static_cast<observability::MultiObserver &>(*multi).size() == 2,
                             "both backends should be added");

                     config.observability.backend = "log, none, LOG, bogus";
                     auto deduped = observability::create_observer(config);
                     require(static_cast<observability::MultiObserver &>(*deduped).backend_names() ==
                                 "log,noop",
                             "repeated and unknown backends should be skipped");
                     config.observability.backend = "bogus";
                     require(observability::create_observer(config)->name() == "log",
                             "an unknown single backend falls back to log");
                   }});

  tests.push_back({"observability_global_observer_swap", [] {
                     {
                       testing::ObserverScope scope;
                       observability::record_error("unit", "recorded");
                       observability::record_turn_rejected("s1", "empty utterance");
                       observability::record_active_sessions(2);
                       require(scope.observer().events().size() == 2, "events should be recorded");
                       require(scope.observer().metric_count() == 1, "metric should be recorded");
                     }
                     require(observability::get_global_observer() == nullptr,
                             "scope should uninstall the observer");
                     observability::record_error("unit", "dropped");
                   }});
}
