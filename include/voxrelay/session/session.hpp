#pragma once

#include "voxrelay/common/result.hpp"
#include "voxrelay/conversation/conversation_state.hpp"
#include "voxrelay/events/enricher.hpp"
#include "voxrelay/events/forwarder.hpp"
#include "voxrelay/response/generator.hpp"
#include "voxrelay/turn/turn_controller.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace voxrelay::session {

/// Builds the speech path for a session; the sink publishes through the session's forwarder.
/// A factory returning nullptr falls back to a text-only sink.
using SpeechSinkFactory =
    std::function<std::unique_ptr<turn::ISpeechSink>(events::IEventPublisher &)>;

struct SessionOptions {
  /// Empty generates a UUIDv4.
  std::string session_id;
  std::string peer;
  std::string enricher_policy = "selective";
  /// Connection metadata for the selective policy.
  events::Object metadata;
  /// Fields for the global policy.
  events::Object inject_fields;
  std::size_t queue_capacity = 256;
  turn::ConcurrentTurnPolicy concurrent_policy = turn::ConcurrentTurnPolicy::CancelActive;
  std::string system_prompt;
  std::string version = "0.1.0";
  turn::CommitHook commit_hook;
};

/// `{connection_time, user_agent}` merged with `extra`.
[[nodiscard]] events::Object connection_metadata(const std::string &user_agent,
                                                 const events::Object &extra = {});

/// Selective or global enricher for a session, per `options.enricher_policy`.
[[nodiscard]] common::Result<std::shared_ptr<events::IEventEnricher>>
create_enricher(const SessionOptions &options);

/// One live conversation: the state, turn controller and event path bound to a
/// single client connection. `close` (or destruction) cancels any in-flight turn.
class Session {
public:
  Session(SessionOptions options, std::shared_ptr<events::IEventEnricher> enricher,
          std::shared_ptr<response::IResponseGenerator> generator, events::IEventChannel &channel,
          SpeechSinkFactory speech_factory = nullptr);
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  void start();
  /// Tears the session down. Safe to call more than once.
  void close();

  void on_client_ready();
  /// Publishes the transcription; final text is submitted as an utterance.
  std::optional<turn::SubmitResult> on_transcription(const std::string &text, bool final,
                                      const std::string &user_id = "",
                                      const std::string &timestamp = "");
  /// New caller speech interrupts the bot.
  void on_user_started_speaking();
  void on_user_stopped_speaking();
  void update_context(const std::string &key, events::Value value);
  void publish(events::OutboundEvent event);

  [[nodiscard]] const std::string &id() const { return options_.session_id; }
  [[nodiscard]] bool is_open() const;
  [[nodiscard]] turn::TurnController &controller() { return *controller_; }
  [[nodiscard]] events::IEventEnricher &enricher() { return *enricher_; }
  [[nodiscard]] events::EventForwarder &forwarder() { return *forwarder_; }
  [[nodiscard]] conversation::History history() const { return controller_->history(); }

private:
  SessionOptions options_;
  std::shared_ptr<events::IEventEnricher> enricher_;
  std::unique_ptr<events::EventForwarder> forwarder_;
  std::unique_ptr<turn::ISpeechSink> speech_;
  conversation::ConversationState conversation_;
  std::unique_ptr<turn::TurnController> controller_;

  mutable std::mutex mutex_;
  bool started_ = false;
  bool closed_ = false;
  std::chrono::steady_clock::time_point started_at_{};
};

} // namespace voxrelay::session
