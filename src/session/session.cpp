#include "voxrelay/session/session.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/common/ids.hpp"
#include "voxrelay/events/event.hpp"
#include "voxrelay/observability/global.hpp"
#include "voxrelay/tts/speech_sink.hpp"

namespace voxrelay::session {

events::Object connection_metadata(const std::string &user_agent, const events::Object &extra) {
  events::Object metadata{
      {"connection_time", events::Value(common::epoch_seconds_now())},
      {"user_agent", events::Value(user_agent)},
  };
  metadata.merge(extra);
  return metadata;
}

common::Result<std::shared_ptr<events::IEventEnricher>>
create_enricher(const SessionOptions &options) {
  const std::string policy = common::to_lower(common::trim(options.enricher_policy));
  if (policy.empty() || policy == "selective") {
    return common::Result<std::shared_ptr<events::IEventEnricher>>::success(
        std::make_shared<events::SelectiveEnricher>(options.session_id, options.metadata));
  }
  if (policy == "global") {
    events::Object fields{{"session_id", events::Value(options.session_id)}};
    fields.merge(options.inject_fields);
    return common::Result<std::shared_ptr<events::IEventEnricher>>::success(
        std::make_shared<events::GlobalEnricher>(std::move(fields)));
  }
  return common::Result<std::shared_ptr<events::IEventEnricher>>::failure(
      "unknown enricher policy: " + options.enricher_policy);
}

Session::Session(SessionOptions options, std::shared_ptr<events::IEventEnricher> enricher,
                 std::shared_ptr<response::IResponseGenerator> generator,
                 events::IEventChannel &channel, SpeechSinkFactory speech_factory)
    : options_(std::move(options)), enricher_(std::move(enricher)),
      conversation_(options_.system_prompt) {
  if (options_.session_id.empty()) {
    options_.session_id = common::generate_uuid_v4();
  }
  forwarder_ = std::make_unique<events::EventForwarder>(
      enricher_, channel,
      events::EventForwarderOptions{.queue_capacity = options_.queue_capacity,
                                    .session_id = options_.session_id});
  if (speech_factory) {
    speech_ = speech_factory(*forwarder_);
  }
  if (speech_ == nullptr) {
    speech_ = std::make_unique<tts::NullSpeechSink>(*forwarder_);
  }
  controller_ = std::make_unique<turn::TurnController>(
      conversation_, std::move(generator), *speech_, *forwarder_,
      turn::TurnControllerOptions{.concurrent_policy = options_.concurrent_policy,
                                  .session_id = options_.session_id});
  if (options_.commit_hook) {
    controller_->set_commit_hook(options_.commit_hook);
  }
}

Session::~Session() { close(); }

void Session::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || closed_) {
      return;
    }
    started_ = true;
    started_at_ = std::chrono::steady_clock::now();
  }
  forwarder_->start();
  controller_->start();
  observability::record_event(observability::SessionStartEvent{
      .session_id = options_.session_id, .peer = options_.peer});
}

void Session::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    if (!started_) {
      return;
    }
  }
  // The controller's final boundary events still reach the forwarder's queue.
  controller_->stop();
  forwarder_->stop();
  observability::record_event(observability::SessionEndEvent{
      .session_id = options_.session_id,
      .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started_at_)});
}

bool Session::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_ && !closed_;
}

void Session::publish(events::OutboundEvent event) { forwarder_->publish(std::move(event)); }

void Session::on_client_ready() {
  publish(events::make_bot_ready(options_.version, "voxrelay voice relay"));
}

std::optional<turn::SubmitResult> Session::on_transcription(const std::string &text, const bool final,
                                             const std::string &user_id,
                                             const std::string &timestamp) {
  const std::string stamp = timestamp.empty() ? common::iso8601_now() : timestamp;
  publish(events::make_user_transcription(text, user_id, stamp, final));
  if (!final) {
    return std::nullopt;
  }
  return controller_->submit_utterance(text);
}

void Session::on_user_started_speaking() {
  publish(events::make_event(events::EventKind::UserStartedSpeaking));
  (void)controller_->barge_in();
}

void Session::on_user_stopped_speaking() {
  publish(events::make_event(events::EventKind::UserStoppedSpeaking));
}

void Session::update_context(const std::string &key, events::Value value) {
  enricher_->update_context(key, std::move(value));
}

} // namespace voxrelay::session
