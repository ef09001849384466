#pragma once

#include "voxrelay/common/result.hpp"
#include "voxrelay/events/value.hpp"
#include "voxrelay/session/session.hpp"

#include <string>

namespace voxrelay::gateway {

enum class ClientMessageType {
  ClientReady,
  Transcription,
  UserStartedSpeaking,
  UserStoppedSpeaking,
  UpdateContext,
  Ping,
};

/// A JSON text frame sent by the client, keyed by `type`.
struct ClientMessage {
  ClientMessageType type = ClientMessageType::Ping;
  std::string text;
  bool final = true;
  std::string user_id;
  std::string timestamp;
  std::string key;
  events::Value value;
};

[[nodiscard]] common::Result<ClientMessage> parse_client_message(const std::string &json);

/// Applies one text frame to the session. Malformed frames are answered with a
/// non-fatal `error` event; the connection stays open.
void handle_client_frame(session::Session &session, const std::string &frame);
void apply_client_message(session::Session &session, const ClientMessage &message);

[[nodiscard]] std::string health_body();
[[nodiscard]] std::string index_page(const std::string &ws_path);

} // namespace voxrelay::gateway
