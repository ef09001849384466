#pragma once

#include "voxrelay/events/value.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace voxrelay::events {

enum class EventKind {
  BotReady,
  UserTranscription,
  UserStartedSpeaking,
  UserStoppedSpeaking,
  BotLlmStarted,
  BotLlmText,
  BotLlmStopped,
  BotTtsText,
  Error,
  ServerMessage,
};

/// Wire name used in the "type" member, e.g. "bot-llm-text".
[[nodiscard]] std::string_view event_kind_name(EventKind kind);
[[nodiscard]] std::optional<EventKind> parse_event_kind(std::string_view name);

inline constexpr std::string_view kMessageLabel = "rtvi-ai";

/// A UI/telemetry message on its way to the client. `payload` is the complete
/// message ({"label","type","data"}); only `data` is touched by enrichers.
struct OutboundEvent {
  EventKind kind = EventKind::ServerMessage;
  Object payload;

  /// The reserved `data` sub-mapping, or nullptr when absent or not an object.
  [[nodiscard]] const Object *data() const;
  [[nodiscard]] Object *data();
  [[nodiscard]] std::string to_json() const;

  bool operator==(const OutboundEvent &other) const {
    return kind == other.kind && payload == other.payload;
  }
};

/// Message skeleton for `kind`, with a `data` member when `data` is given.
[[nodiscard]] OutboundEvent make_event(EventKind kind, std::optional<Object> data = std::nullopt);

[[nodiscard]] OutboundEvent make_bot_ready(const std::string &version, const std::string &about);
[[nodiscard]] OutboundEvent make_user_transcription(const std::string &text,
                                                    const std::string &user_id,
                                                    const std::string &timestamp, bool final);
[[nodiscard]] OutboundEvent make_bot_llm_text(const std::string &text);
[[nodiscard]] OutboundEvent make_bot_tts_text(const std::string &text);
[[nodiscard]] OutboundEvent make_error(const std::string &message, bool fatal);
[[nodiscard]] OutboundEvent make_server_message(Object data);

} // namespace voxrelay::events
