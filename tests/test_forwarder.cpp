#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "voxrelay/events/forwarder.hpp"

#include <variant>

namespace {

namespace events = voxrelay::events;

events::OutboundEvent text_event(const std::string &text) { return events::make_bot_llm_text(text); }

} // namespace

void register_forwarder_tests(std::vector<voxrelay::tests::TestCase> &tests) {
  using voxrelay::tests::require;
  namespace testing = voxrelay::testing;

  tests.push_back({"forwarder_delivers_enriched_events_in_order", [] {
                     testing::RecordingChannel channel;
                     events::EventForwarder forwarder(
                         std::make_shared<events::SelectiveEnricher>("s1", events::Object{}),
                         channel);
                     forwarder.start();
                     require(forwarder.is_running(), "forwarder should be running");
                     forwarder.publish(text_event("one"));
                     forwarder.publish(text_event("two"));
                     forwarder.publish(text_event("three"));
                     forwarder.stop();

                     const auto delivered = channel.log.events();
                     require(delivered.size() == 3, "expected three deliveries");
                     require(testing::data_string(delivered[0], "text") == "one" &&
                                 testing::data_string(delivered[1], "text") == "two" &&
                                 testing::data_string(delivered[2], "text") == "three",
                             "delivery order mismatch");
                     for (const auto &event : delivered) {
                       require(testing::data_string(event, "session_id") == "s1",
                               "event was not enriched");
                     }
                     require(forwarder.delivered_count() == 3, "delivered counter mismatch");
                     require(!forwarder.is_running(), "forwarder should be stopped");
                   }});

  tests.push_back({"forwarder_drops_oldest_text_when_full", [] {
                     testing::ObserverScope scope;
                     testing::RecordingChannel channel;
                     events::EventForwarder forwarder(
                         nullptr, channel,
                         events::EventForwarderOptions{.queue_capacity = 3, .session_id = "s1"});

                     // Not started yet, so everything stays queued.
                     forwarder.publish(events::make_event(events::EventKind::BotLlmStarted));
                     forwarder.publish(text_event("a"));
                     forwarder.publish(text_event("b"));
                     forwarder.publish(text_event("c"));
                     forwarder.publish(events::make_event(events::EventKind::BotLlmStopped));
                     require(forwarder.dropped_count() == 2, "two text events should be dropped");
                     require(forwarder.queue_depth() == 3, "queue should stay at capacity");

                     forwarder.start();
                     forwarder.stop();
                     const auto delivered = channel.log.events();
                     require(delivered.size() == 3, "expected three deliveries");
                     require(delivered[0].kind == events::EventKind::BotLlmStarted,
                             "turn start must survive backpressure");
                     require(testing::data_string(delivered[1], "text") == "c",
                             "oldest text events should have been dropped");
                     require(delivered[2].kind == events::EventKind::BotLlmStopped,
                             "turn end must survive backpressure");

                     std::size_t drops = 0;
                     for (const auto &event : scope.observer().events()) {
                       if (const auto *dropped =
                               std::get_if<voxrelay::observability::EventDroppedEvent>(&event)) {
                         require(dropped->session_id == "s1" && dropped->kind == "bot-llm-text",
                                 "only text events may be reported as dropped");
                         ++drops;
                       }
                     }
                     require(drops == 2, "each drop should be reported to the observer");
                   }});

  tests.push_back({"forwarder_never_sheds_lifecycle_events", [] {
                     testing::RecordingChannel channel;
                     events::EventForwarder forwarder(
                         nullptr, channel, events::EventForwarderOptions{.queue_capacity = 2});

                     forwarder.publish(events::make_event(events::EventKind::BotLlmStarted));
                     forwarder.publish(events::make_error("late", false));
                     forwarder.publish(text_event("shed"));
                     forwarder.publish(events::make_event(events::EventKind::BotLlmStopped));
                     require(forwarder.dropped_count() == 1, "only the text event is shed");
                     require(forwarder.queue_depth() == 3, "lifecycle events may exceed capacity");

                     forwarder.start();
                     forwarder.stop();
                     const auto delivered = channel.log.events();
                     require(delivered.size() == 3 &&
                                 delivered[0].kind == events::EventKind::BotLlmStarted &&
                                 delivered[1].kind == events::EventKind::Error &&
                                 delivered[2].kind == events::EventKind::BotLlmStopped,
                             "lifecycle events should be delivered in order");
                     require(events::is_sheddable(events::EventKind::BotTtsText) &&
                                 !events::is_sheddable(events::EventKind::UserTranscription) &&
                                 !events::is_sheddable(events::EventKind::BotReady),
                             "shedding policy mismatch");
                   }});

  tests.push_back({"forwarder_publish_never_blocks_on_slow_channel", [] {
                     testing::RecordingChannel channel;
                     channel.block();
                     events::EventForwarder forwarder(
                         nullptr, channel, events::EventForwarderOptions{.queue_capacity = 4});
                     forwarder.start();
                     for (int i = 0; i < 10; ++i) {
                       forwarder.publish(text_event(std::to_string(i)));
                     }
                     require(forwarder.dropped_count() >= 5, "full queue should shed events");
                     channel.unblock();
                     forwarder.stop();
                     require(forwarder.delivered_count() + forwarder.dropped_count() == 10,
                             "every event is either delivered or dropped");
                     const auto delivered = channel.log.events();
                     require(testing::data_string(delivered.back(), "text") == "9",
                             "newest event should survive");
                   }});

  tests.push_back({"forwarder_reports_delivery_failures", [] {
                     testing::ObserverScope scope;
                     testing::RecordingChannel channel;
                     channel.fail_sends(true);
                     events::EventForwarder forwarder(nullptr, channel);
                     forwarder.start();
                     forwarder.publish(text_event("lost"));
                     forwarder.stop();

                     require(forwarder.delivered_count() == 0, "failed sends are not deliveries");
                     bool saw_error = false;
                     for (const auto &event : scope.observer().events()) {
                       if (const auto *error =
                               std::get_if<voxrelay::observability::ErrorEvent>(&event)) {
                         saw_error = saw_error || error->component == "events";
                       }
                     }
                     require(saw_error, "delivery failure should be recorded");
                   }});

  tests.push_back({"forwarder_stop_is_idempotent", [] {
                     testing::RecordingChannel channel;
                     events::EventForwarder forwarder(nullptr, channel);
                     forwarder.stop();
                     forwarder.start();
                     forwarder.stop();
                     forwarder.stop();
                     require(!forwarder.is_running(), "forwarder should stay stopped");
                   }});
}
