#pragma once

#include "voxrelay/common/result.hpp"
#include "voxrelay/config/schema.hpp"
#include "voxrelay/events/forwarder.hpp"
#include "voxrelay/gateway/websocket.hpp"
#include "voxrelay/response/generator.hpp"
#include "voxrelay/response/http_client.hpp"
#include "voxrelay/session/session.hpp"
#include "voxrelay/transcripts/store.hpp"
#include "voxrelay/tts/speech_sink.hpp"
#include "voxrelay/tts/tts.hpp"

#include <memory>
#include <string>
#include <vector>

namespace voxrelay::runtime {

/// Loaded configuration plus the process-wide collaborators every session shares:
/// the response generator, the TTS engine and the transcript archive.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Validates the configuration and builds the shared collaborators. Returns the
  /// validation warnings. `http_client` replaces the curl client for remote backends.
  [[nodiscard]] common::Result<std::vector<std::string>>
  initialize(std::shared_ptr<response::HttpClient> http_client = nullptr);

  /// Installs the observer named by the configuration as the global one.
  void install_observer() const;

  /// A fresh session bound to `channel`. Audio goes to `audio` when TTS is enabled;
  /// with no audio output the session publishes text only.
  [[nodiscard]] common::Result<std::unique_ptr<session::Session>>
  create_session(const std::string &peer, events::IEventChannel &channel,
                 tts::IAudioOutput *audio = nullptr) const;

  /// The session factory refers back to this context, which must outlive the server.
  [[nodiscard]] gateway::GatewayOptions gateway_options() const;

  [[nodiscard]] std::shared_ptr<response::IResponseGenerator> generator() const {
    return generator_;
  }
  [[nodiscard]] std::shared_ptr<tts::TtsEngine> tts_engine() const { return tts_engine_; }
  [[nodiscard]] std::shared_ptr<transcripts::TranscriptStore> transcript_store() const {
    return transcripts_;
  }

private:
  config::Config config_;
  std::shared_ptr<response::IResponseGenerator> generator_;
  std::shared_ptr<tts::TtsEngine> tts_engine_;
  std::shared_ptr<transcripts::TranscriptStore> transcripts_;
};

} // namespace voxrelay::runtime
