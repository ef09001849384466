#include "voxrelay/events/event.hpp"

#include <array>
#include <utility>

namespace voxrelay::events {

namespace {

constexpr std::array<std::pair<EventKind, std::string_view>, 10> kKindNames{{
    {EventKind::BotReady, "bot-ready"},
    {EventKind::UserTranscription, "user-transcription"},
    {EventKind::UserStartedSpeaking, "user-started-speaking"},
    {EventKind::UserStoppedSpeaking, "user-stopped-speaking"},
    {EventKind::BotLlmStarted, "bot-llm-started"},
    {EventKind::BotLlmText, "bot-llm-text"},
    {EventKind::BotLlmStopped, "bot-llm-stopped"},
    {EventKind::BotTtsText, "bot-tts-text"},
    {EventKind::Error, "error"},
    {EventKind::ServerMessage, "server-message"},
}};

} // namespace

std::string_view event_kind_name(const EventKind kind) {
  for (const auto &[candidate, name] : kKindNames) {
    if (candidate == kind) {
      return name;
    }
  }
  return "server-message";
}

std::optional<EventKind> parse_event_kind(const std::string_view name) {
  for (const auto &[kind, candidate] : kKindNames) {
    if (candidate == name) {
      return kind;
    }
  }
  return std::nullopt;
}

const Object *OutboundEvent::data() const {
  const Value *value = payload.find("data");
  if (value == nullptr || !value->is_object()) {
    return nullptr;
  }
  return &value->as_object();
}

Object *OutboundEvent::data() {
  Value *value = payload.find("data");
  if (value == nullptr || !value->is_object()) {
    return nullptr;
  }
  return &value->as_object();
}

std::string OutboundEvent::to_json() const { return events::to_json(payload); }

OutboundEvent make_event(const EventKind kind, std::optional<Object> data) {
  OutboundEvent event;
  event.kind = kind;
  event.payload.set("label", std::string(kMessageLabel));
  event.payload.set("type", std::string(event_kind_name(kind)));
  if (data.has_value()) {
    event.payload.set("data", std::move(*data));
  }
  return event;
}

OutboundEvent make_bot_ready(const std::string &version, const std::string &about) {
  return make_event(EventKind::BotReady, Object{{"version", version}, {"about", about}});
}

OutboundEvent make_user_transcription(const std::string &text, const std::string &user_id,
                                      const std::string &timestamp, const bool final) {
  return make_event(EventKind::UserTranscription, Object{{"text", text},
                                                         {"user_id", user_id},
                                                         {"timestamp", timestamp},
                                                         {"final", final}});
}

OutboundEvent make_bot_llm_text(const std::string &text) {
  return make_event(EventKind::BotLlmText, Object{{"text", text}});
}

OutboundEvent make_bot_tts_text(const std::string &text) {
  return make_event(EventKind::BotTtsText, Object{{"text", text}});
}

OutboundEvent make_error(const std::string &message, const bool fatal) {
  return make_event(EventKind::Error, Object{{"error", message}, {"fatal", fatal}});
}

OutboundEvent make_server_message(Object data) {
  return make_event(EventKind::ServerMessage, std::move(data));
}

} // namespace voxrelay::events
