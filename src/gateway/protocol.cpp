#include "voxrelay/gateway/protocol.hpp"

#include "voxrelay/events/event.hpp"
#include "voxrelay/observability/global.hpp"

#include <sstream>

namespace voxrelay::gateway {

namespace {

common::Result<ClientMessage> fail(const std::string &message) {
  return common::Result<ClientMessage>::failure(message);
}

const std::string *string_field(const events::Object &object, const std::string &key) {
  const auto *value = object.find(key);
  if (value == nullptr || !value->is_string()) {
    return nullptr;
  }
  return &value->as_string();
}

} // namespace

common::Result<ClientMessage> parse_client_message(const std::string &json) {
  auto parsed = events::parse_json(json);
  if (!parsed.ok()) {
    return fail("invalid JSON: " + parsed.error());
  }
  if (!parsed.value().is_object()) {
    return fail("message must be a JSON object");
  }
  const auto &object = parsed.value().as_object();
  const auto *type = string_field(object, "type");
  if (type == nullptr) {
    return fail("message is missing a string 'type'");
  }

  ClientMessage message;
  if (*type == "client-ready") {
    message.type = ClientMessageType::ClientReady;
  } else if (*type == "transcription") {
    message.type = ClientMessageType::Transcription;
    const auto *text = string_field(object, "text");
    if (text == nullptr) {
      return fail("transcription requires a string 'text'");
    }
    message.text = *text;
    if (const auto *final = object.find("final"); final != nullptr) {
      if (!final->is_bool()) {
        return fail("transcription 'final' must be a boolean");
      }
      message.final = final->as_bool();
    }
    if (const auto *user_id = string_field(object, "user_id"); user_id != nullptr) {
      message.user_id = *user_id;
    }
    if (const auto *timestamp = string_field(object, "timestamp"); timestamp != nullptr) {
      message.timestamp = *timestamp;
    }
  } else if (*type == "user-started-speaking") {
    message.type = ClientMessageType::UserStartedSpeaking;
  } else if (*type == "user-stopped-speaking") {
    message.type = ClientMessageType::UserStoppedSpeaking;
  } else if (*type == "update-context") {
    message.type = ClientMessageType::UpdateContext;
    const auto *key = string_field(object, "key");
    if (key == nullptr || key->empty()) {
      return fail("update-context requires a non-empty string 'key'");
    }
    const auto *value = object.find("value");
    if (value == nullptr) {
      return fail("update-context requires a 'value'");
    }
    message.key = *key;
    message.value = *value;
  } else if (*type == "ping") {
    message.type = ClientMessageType::Ping;
  } else {
    return fail("unknown message type: " + *type);
  }
  return common::Result<ClientMessage>::success(std::move(message));
}

void apply_client_message(session::Session &session, const ClientMessage &message) {
  switch (message.type) {
  case ClientMessageType::ClientReady:
    session.on_client_ready();
    break;
  case ClientMessageType::Transcription:
    (void)session.on_transcription(message.text, message.final, message.user_id,
                                   message.timestamp);
    break;
  case ClientMessageType::UserStartedSpeaking:
    session.on_user_started_speaking();
    break;
  case ClientMessageType::UserStoppedSpeaking:
    session.on_user_stopped_speaking();
    break;
  case ClientMessageType::UpdateContext:
    session.update_context(message.key, message.value);
    break;
  case ClientMessageType::Ping:
    session.publish(events::make_server_message(events::Object{{"pong", events::Value(true)}}));
    break;
  }
}

void handle_client_frame(session::Session &session, const std::string &frame) {
  const auto parsed = parse_client_message(frame);
  if (!parsed.ok()) {
    observability::record_error("gateway", "session " + session.id() + ": " + parsed.error());
    session.publish(events::make_error(parsed.error(), false));
    return;
  }
  apply_client_message(session, parsed.value());
}

std::string health_body() { return R"({"status":"healthy"})"; }

std::string index_page(const std::string &ws_path) {
  std::ostringstream html;
  html << "<!DOCTYPE html>\n<html>\n<head><title>VoxRelay</title></head>\n<body>\n"
       << "<h1>VoxRelay voice relay</h1>\n"
       << "<p>Connect a client to <code>" << ws_path
       << "</code> to start a voice conversation.</p>\n"
       << "<p>Liveness probe: <code>/health</code></p>\n"
       << "</body>\n</html>\n";
  return html.str();
}

} // namespace voxrelay::gateway
