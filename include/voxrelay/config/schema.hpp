#pragma once

#include "voxrelay/events/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace voxrelay::config {

inline constexpr const char *DEFAULT_SYSTEM_PROMPT =
    "You are a helpful AI voice assistant. Keep your responses concise and conversational "
    "since they will be spoken aloud. Be friendly and engaging.";

struct ServerConfig {
  std::string host = "0.0.0.0";
  std::uint16_t port = 8000;
  std::string path = "/ws";
  std::uint32_t max_connections = 64;
  bool tls_enabled = false;
  std::string tls_cert_file;
  std::string tls_key_file;
};

struct GeneratorConfig {
  std::string backend = "template";
  /// Empty selects the backend's default endpoint.
  std::string base_url;
  std::optional<std::string> api_key;
  std::string model = "gpt-4o-mini";
  double temperature = 0.7;
  std::uint64_t timeout_ms = 60'000;
  std::size_t max_history_turns = 10;
  std::string system_prompt = DEFAULT_SYSTEM_PROMPT;
  /// [generator.templates] keyword = "reply", in file order.
  std::vector<std::pair<std::string, std::string>> templates;
};

struct TurnsConfig {
  std::string concurrent_policy = "cancel_active";
};

struct EnricherConfig {
  std::string policy = "selective";
  std::string user_agent = "voxrelay";
  events::Object metadata;
  events::Object inject;
};

struct EventsConfig {
  std::size_t queue_capacity = 256;
};

struct TtsConfig {
  bool enabled = false;
  std::string backend = "system";
  std::string command;
  std::optional<std::string> voice;
  std::optional<std::string> rate;
  bool dry_run = false;
};

struct TranscriptsConfig {
  bool enabled = false;
  std::string path = "~/.voxrelay/transcripts.db";
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct Config {
  ServerConfig server;
  GeneratorConfig generator;
  TurnsConfig turns;
  EnricherConfig enricher;
  EventsConfig events;
  TtsConfig tts;
  TranscriptsConfig transcripts;
  ObservabilityConfig observability;
};

} // namespace voxrelay::config
