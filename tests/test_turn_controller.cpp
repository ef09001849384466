#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "voxrelay/turn/turn_controller.hpp"

#include <variant>

namespace {

namespace turn = voxrelay::turn;
namespace events = voxrelay::events;
namespace conversation = voxrelay::conversation;
namespace testing = voxrelay::testing;

struct Harness {
  explicit Harness(std::shared_ptr<testing::ScriptedGenerator> scripted,
                   turn::TurnControllerOptions options = {.session_id = "s1"})
      : generator(std::move(scripted)), conversation_state("be brief"),
        controller(conversation_state, generator, speech, publisher, std::move(options)) {}

  bool wait_for_fragments(const std::size_t count) {
    return testing::wait_until([&] { return speech.fragments().size() >= count; });
  }

  std::shared_ptr<testing::ScriptedGenerator> generator;
  conversation::ConversationState conversation_state;
  testing::RecordingSpeechSink speech;
  testing::RecordingPublisher publisher;
  turn::TurnController controller;
};

std::shared_ptr<testing::ScriptedGenerator> hanging_generator(std::vector<std::string> fragments) {
  return std::make_shared<testing::ScriptedGenerator>(std::vector<testing::GeneratorScript>{
      testing::GeneratorScript{.fragments = std::move(fragments), .hang = true}});
}

} // namespace

void register_turn_controller_tests(std::vector<voxrelay::tests::TestCase> &tests) {
  using voxrelay::tests::require;

  tests.push_back({"turn_completes_and_commits_reply", [] {
                     Harness harness(testing::make_generator({"Hi", " there"}));
                     std::vector<std::string> hooked;
                     harness.controller.set_commit_hook(
                         [&hooked](std::uint64_t id, const std::string &user, const std::string &reply) {
                           hooked.push_back(std::to_string(id) + "|" + user + "|" + reply);
                         });
                     harness.controller.start();

                     require(harness.controller.submit_utterance("  hello ") == turn::SubmitResult::Started,
                             "submit should start a turn");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout),
                             "turn did not finish");

                     const auto fragments = harness.speech.fragments();
                     require(fragments.size() == 2, "expected two fragments");
                     require(fragments[0].turn_id == 1 && fragments[0].sequence == 0 &&
                                 fragments[0].text == "Hi",
                             "first fragment mismatch");
                     require(fragments[1].sequence == 1 && fragments[1].text == " there",
                             "second fragment mismatch");

                     const auto history = harness.controller.history();
                     require(history.size() == 2, "expected user and assistant entries");
                     require(history[0].role == conversation::Role::User && history[0].text == "hello",
                             "user entry mismatch");
                     require(history[1].role == conversation::Role::Assistant &&
                                 history[1].text == "Hi there",
                             "assistant entry should be the concatenated fragments");

                     const auto calls = harness.speech.calls();
                     require(calls.front() == "begin:1" && calls.back() == "end:1:completed",
                             "speech boundaries mismatch");
                     const auto kinds = harness.publisher.log.kinds();
                     require(kinds == std::vector<events::EventKind>{events::EventKind::BotLlmStarted,
                                                                     events::EventKind::BotLlmText,
                                                                     events::EventKind::BotLlmText,
                                                                     events::EventKind::BotLlmStopped},
                             "event sequence mismatch");
                     require(testing::data_string(harness.publisher.log.events()[1], "text") == "Hi",
                             "text event should carry the fragment");
                     require(hooked.size() == 1 && hooked[0] == "1|hello|Hi there",
                             "commit hook mismatch");
                     require(harness.generator->released_streams() == 1,
                             "stream should be released after the turn");
                   }});

  tests.push_back({"turn_generation_input_excludes_current_utterance", [] {
                     Harness harness(testing::make_generator({"ok"}));
                     harness.controller.start();
                     require(harness.controller.submit_utterance("first") == turn::SubmitResult::Started,
                             "first submit failed");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout), "first turn stuck");
                     require(harness.controller.submit_utterance("second") == turn::SubmitResult::Started,
                             "second submit failed");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout), "second turn stuck");

                     const auto inputs = harness.generator->inputs();
                     require(inputs.size() == 2, "expected two generate calls");
                     require(inputs[0].history.empty() && inputs[0].utterance == "first",
                             "first input mismatch");
                     require(inputs[1].history.size() == 2 && inputs[1].history[1].text == "ok" &&
                                 inputs[1].utterance == "second",
                             "second input should see the first exchange only");
                     require(inputs[1].system_prompt == "be brief", "system prompt missing");
                     require(harness.controller.last_turn_id() == 2, "turn ids should increase");
                   }});

  tests.push_back({"turn_generator_failure_ends_without_commit", [] {
                     testing::ObserverScope scope;
                     Harness harness(std::make_shared<testing::ScriptedGenerator>(
                         std::vector<testing::GeneratorScript>{testing::GeneratorScript{
                             .fragments = {"par"}, .error = std::string("upstream reset")}}));
                     harness.controller.start();
                     require(harness.controller.submit_utterance("hello") == turn::SubmitResult::Started,
                             "submit failed");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout), "turn stuck");

                     const auto ends = harness.speech.ends();
                     require(ends.size() == 1, "exactly one end boundary expected");
                     require(ends[0].outcome == turn::TurnOutcome::Failed &&
                                 ends[0].reason == turn::CancelReason::GenerationFailure,
                             "failure should end the turn as failed");
                     require(ends[0].fragments == 1, "forwarded fragment should be counted");

                     const auto history = harness.controller.history();
                     require(history.size() == 1 && history[0].role == conversation::Role::User,
                             "no assistant entry after failure");
                     require(harness.publisher.log.count(events::EventKind::BotLlmStopped) == 1,
                             "stopped event expected");

                     bool reported = false;
                     for (const auto &event : scope.observer().events()) {
                       if (const auto *failure =
                               std::get_if<voxrelay::observability::GenerationFailureEvent>(&event)) {
                         reported = failure->session_id == "s1" && failure->fragments_forwarded == 1 &&
                                    failure->message == "upstream reset";
                       }
                     }
                     require(reported, "generation failure should be observed");
                   }});

  tests.push_back({"turn_generator_throwing_is_a_failure", [] {
                     Harness harness(std::make_shared<testing::ScriptedGenerator>(
                         std::vector<testing::GeneratorScript>{
                             testing::GeneratorScript{.throw_on_generate = true}}));
                     harness.controller.start();
                     require(harness.controller.submit_utterance("hello") == turn::SubmitResult::Started,
                             "submit failed");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout), "turn stuck");

                     const auto ends = harness.speech.ends();
                     require(ends.size() == 1 && ends[0].outcome == turn::TurnOutcome::Failed &&
                                 ends[0].reason == turn::CancelReason::GenerationFailure &&
                                 ends[0].fragments == 0,
                             "throwing generator should fail the turn");
                     require(harness.publisher.log.kinds() ==
                                 std::vector<events::EventKind>{events::EventKind::BotLlmStarted,
                                                                events::EventKind::BotLlmStopped},
                             "boundaries should still be emitted");
                     require(harness.controller.state() == turn::ControllerState::Idle,
                             "controller should return to idle");
                   }});

  tests.push_back({"turn_with_no_fragments_completes_without_reply", [] {
                     Harness harness(testing::make_generator({}));
                     harness.controller.start();
                     require(harness.controller.submit_utterance("hello") == turn::SubmitResult::Started,
                             "submit failed");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout), "turn stuck");

                     const auto ends = harness.speech.ends();
                     require(ends.size() == 1 && ends[0].outcome == turn::TurnOutcome::Completed &&
                                 ends[0].fragments == 0,
                             "empty reply should complete");
                     require(harness.controller.history().size() == 1,
                             "no assistant entry for an empty reply");
                   }});

  tests.push_back({"turn_whitespace_reply_completes_without_reply", [] {
                     Harness harness(testing::make_generator({"\n", "  "}));
                     std::vector<std::string> hooked;
                     harness.controller.set_commit_hook(
                         [&hooked](std::uint64_t, const std::string &user, const std::string &reply) {
                           hooked.push_back(user + "|" + reply);
                         });
                     harness.controller.start();
                     require(harness.controller.submit_utterance("hello") == turn::SubmitResult::Started,
                             "submit failed");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout), "turn stuck");

                     const auto ends = harness.speech.ends();
                     require(ends.size() == 1 && ends[0].outcome == turn::TurnOutcome::Completed &&
                                 !ends[0].reason.has_value() && ends[0].fragments == 2,
                             "whitespace reply should complete normally");
                     require(harness.controller.history().size() == 1,
                             "no assistant entry for a blank reply");
                     require(hooked == std::vector<std::string>{"hello|"}, "hook should see an empty reply");
                     require(harness.publisher.log.count(events::EventKind::Error) == 0,
                             "a blank reply is not an error");
                   }});

  tests.push_back({"turn_barge_in_cancels_stream", [] {
                     Harness harness(hanging_generator({"a"}));
                     harness.controller.start();
                     require(harness.controller.submit_utterance("tell me a story") ==
                                 turn::SubmitResult::Started,
                             "submit failed");
                     require(harness.wait_for_fragments(1), "first fragment never arrived");
                     require(harness.controller.state() == turn::ControllerState::Streaming,
                             "turn should be streaming");
                     require(testing::wait_until([&] {
                               const auto active = harness.controller.active_turn();
                               return active.has_value() && active->fragments_forwarded == 1;
                             }),
                             "active turn should track forwarded fragments");

                     require(harness.controller.barge_in(), "barge-in should cancel the turn");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout),
                             "cancelled turn did not end");

                     const auto ends = harness.speech.ends();
                     require(ends.size() == 1, "exactly one end boundary expected");
                     require(ends[0].outcome == turn::TurnOutcome::Cancelled &&
                                 ends[0].reason == turn::CancelReason::BargeIn,
                             "end should report the barge-in");
                     require(harness.speech.interrupted_turns() == std::vector<std::uint64_t>{1},
                             "sink should be interrupted for the cancelled turn");
                     require(harness.controller.history().size() == 1,
                             "cancelled reply must not be committed");
                     require(harness.publisher.log.count(events::EventKind::BotLlmStopped) == 1,
                             "stopped event expected");
                     require(!harness.controller.barge_in(), "nothing left to cancel");
                     require(harness.generator->released_streams() == 1, "stream should be released");
                   }});

  tests.push_back({"turn_cancel_active_runs_newest_utterance", [] {
                     Harness harness(std::make_shared<testing::ScriptedGenerator>(
                         std::vector<testing::GeneratorScript>{
                             testing::GeneratorScript{.fragments = {"one"}, .hang = true},
                             testing::GeneratorScript{.fragments = {"two"}}}));
                     harness.controller.start();
                     require(harness.controller.submit_utterance("first") == turn::SubmitResult::Started,
                             "first submit failed");
                     require(harness.wait_for_fragments(1), "first turn never streamed");
                     require(harness.controller.submit_utterance("second") == turn::SubmitResult::Queued,
                             "second utterance should be queued");
                     require(harness.speech.wait_for_ends(2), "second turn never ended");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout), "controller stuck");

                     const auto ends = harness.speech.ends();
                     require(ends[0].turn_id == 1 && ends[0].outcome == turn::TurnOutcome::Cancelled &&
                                 ends[0].reason == turn::CancelReason::Superseded,
                             "first turn should be superseded");
                     require(ends[1].turn_id == 2 && ends[1].outcome == turn::TurnOutcome::Completed,
                             "second turn should complete");

                     require(harness.speech.interrupted_turns() == std::vector<std::uint64_t>{1},
                             "only the superseded turn should be interrupted");
                     const auto calls = harness.speech.calls();
                     require(calls == std::vector<std::string>{"begin:1", "speak:1:0:one", "end:1:cancelled",
                                                               "begin:2", "speak:2:0:two", "end:2:completed"},
                             "turns must not overlap");

                     const auto history = harness.controller.history();
                     require(history.size() == 3 && history[0].text == "first" &&
                                 history[1].text == "second" && history[2].text == "two",
                             "only the completed reply is committed");
                   }});

  tests.push_back({"turn_drop_new_rejects_while_busy", [] {
                     Harness harness(hanging_generator({"a"}),
                                     turn::TurnControllerOptions{
                                         .concurrent_policy = turn::ConcurrentTurnPolicy::DropNew,
                                         .session_id = "s1"});
                     harness.controller.start();
                     require(harness.controller.submit_utterance("first") == turn::SubmitResult::Started,
                             "first submit failed");
                     require(harness.wait_for_fragments(1), "first turn never streamed");
                     require(harness.controller.submit_utterance("second") ==
                                 turn::SubmitResult::RejectedBusy,
                             "second utterance should be rejected");

                     require(harness.controller.cancel(turn::CancelReason::Explicit), "cancel failed");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout), "controller stuck");
                     const auto ends = harness.speech.ends();
                     require(ends.size() == 1 && ends[0].reason == turn::CancelReason::Explicit,
                             "only the first turn should have run");
                     require(harness.generator->inputs().size() == 1, "rejected utterance was generated");
                   }});

  tests.push_back({"turn_rejects_empty_and_stopped_submissions", [] {
                     Harness harness(testing::make_generator({"x"}));
                     require(harness.controller.submit_utterance("hello") ==
                                 turn::SubmitResult::RejectedStopped,
                             "not started controller should reject");
                     harness.controller.start();
                     require(harness.controller.submit_utterance(" \t\n") ==
                                 turn::SubmitResult::RejectedEmpty,
                             "blank utterance should be rejected");
                     require(!harness.controller.cancel(turn::CancelReason::Explicit),
                             "cancel on idle should be false");
                     require(harness.controller.state() == turn::ControllerState::Idle, "should stay idle");
                     require(harness.speech.calls().empty(), "no turn should have started");
                   }});

  tests.push_back({"turn_stop_cancels_in_flight_turn", [] {
                     Harness harness(hanging_generator({"a"}));
                     harness.controller.start();
                     require(harness.controller.submit_utterance("hello") == turn::SubmitResult::Started,
                             "submit failed");
                     require(harness.wait_for_fragments(1), "turn never streamed");

                     harness.controller.stop();
                     require(!harness.controller.is_running(), "controller should be stopped");
                     const auto ends = harness.speech.ends();
                     require(ends.size() == 1 && ends[0].outcome == turn::TurnOutcome::Cancelled &&
                                 ends[0].reason == turn::CancelReason::Teardown,
                             "stop should end the turn with teardown");
                     require(harness.controller.submit_utterance("again") ==
                                 turn::SubmitResult::RejectedStopped,
                             "stopped controller should reject");
                     harness.controller.stop();
                     require(harness.speech.ends().size() == 1, "stop must not emit a second end");
                   }});

  tests.push_back({"turn_speech_failure_cancels_turn", [] {
                     Harness harness(testing::make_generator({"a", "b", "c"}));
                     harness.speech.fail_speak("pipe closed");
                     harness.controller.start();
                     require(harness.controller.submit_utterance("hello") == turn::SubmitResult::Started,
                             "submit failed");
                     require(harness.controller.wait_until_idle(testing::kWaitTimeout), "turn stuck");

                     const auto ends = harness.speech.ends();
                     require(ends.size() == 1 && ends[0].outcome == turn::TurnOutcome::Cancelled &&
                                 ends[0].reason == turn::CancelReason::TransportFailure,
                             "sink failure should cancel the turn");
                     require(harness.speech.fragments().size() == 1,
                             "no fragment should follow the failed one");
                     require(ends[0].fragments == 0, "a rejected fragment is not counted as forwarded");
                     require(harness.controller.history().size() == 1, "nothing should be committed");
                   }});

  tests.push_back({"turn_names_and_policy_parsing", [] {
                     require(turn::parse_concurrent_policy("drop_new") == turn::ConcurrentTurnPolicy::DropNew,
                             "drop_new should parse");
                     require(turn::parse_concurrent_policy("cancel_active") ==
                                 turn::ConcurrentTurnPolicy::CancelActive,
                             "cancel_active should parse");
                     require(!turn::parse_concurrent_policy("queue_forever").has_value(),
                             "unknown policy should not parse");
                     require(turn::concurrent_policy_name(turn::ConcurrentTurnPolicy::DropNew) == "drop_new",
                             "policy name mismatch");
                     require(turn::cancel_reason_name(turn::CancelReason::BargeIn) == "barge_in",
                             "reason name mismatch");
                     require(turn::submit_result_name(turn::SubmitResult::RejectedBusy) == "rejected_busy",
                             "submit name mismatch");
                   }});
}
