#include "voxrelay/runtime/app.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/common/ids.hpp"
#include "voxrelay/config/config.hpp"
#include "voxrelay/observability/factory.hpp"
#include "voxrelay/observability/global.hpp"
#include "voxrelay/response/factory.hpp"
#include "voxrelay/turn/turn.hpp"

namespace voxrelay::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

common::Result<std::vector<std::string>>
RuntimeContext::initialize(std::shared_ptr<response::HttpClient> http_client) {
  auto warnings = config::validate_config(config_);
  if (!warnings.ok()) {
    return warnings;
  }

  auto generator = response::create_response_generator(config_.generator, std::move(http_client));
  if (!generator.ok()) {
    return common::Result<std::vector<std::string>>::failure(generator.error());
  }
  generator_ = generator.value();

  if (config_.tts.enabled) {
    auto engine = std::make_shared<tts::TtsEngine>();
    tts::SystemTtsConfig system;
    system.command = config_.tts.command;
    system.default_voice = config_.tts.voice;
    system.default_rate = config_.tts.rate;
    system.dry_run = config_.tts.dry_run;
    if (auto registered = engine->register_provider(
            std::make_unique<tts::SystemTtsProvider>(std::move(system)));
        !registered.ok()) {
      return common::Result<std::vector<std::string>>::failure(registered.error());
    }
    if (auto selected = engine->set_default_provider("system"); !selected.ok()) {
      return common::Result<std::vector<std::string>>::failure(selected.error());
    }
    tts_engine_ = std::move(engine);
  }

  if (config_.transcripts.enabled) {
    auto store = std::make_shared<transcripts::TranscriptStore>(
        common::expand_path(config_.transcripts.path));
    if (!store->is_open()) {
      return common::Result<std::vector<std::string>>::failure(
          "unable to open transcript archive " + store->path().string() + ": " +
          store->open_error());
    }
    transcripts_ = std::move(store);
  }

  return warnings;
}

common::Result<std::unique_ptr<session::Session>>
RuntimeContext::create_session(const std::string &peer, events::IEventChannel &channel,
                               tts::IAudioOutput *audio) const {
  if (generator_ == nullptr) {
    return common::Result<std::unique_ptr<session::Session>>::failure(
        "runtime is not initialized");
  }

  session::SessionOptions options;
  options.session_id = common::generate_uuid_v4();
  options.peer = peer;
  options.enricher_policy = config_.enricher.policy;
  options.metadata = session::connection_metadata(config_.enricher.user_agent,
                                                  config_.enricher.metadata);
  options.inject_fields = config_.enricher.inject;
  options.queue_capacity = config_.events.queue_capacity;
  options.concurrent_policy = turn::parse_concurrent_policy(config_.turns.concurrent_policy)
                                  .value_or(turn::ConcurrentTurnPolicy::CancelActive);
  options.system_prompt = config_.generator.system_prompt;
#ifdef VOXRELAY_VERSION
  options.version = VOXRELAY_VERSION;
#endif

  if (transcripts_ != nullptr) {
    auto store = transcripts_;
    const std::string session_id = options.session_id;
    options.commit_hook = [store, session_id](std::uint64_t turn_id, const std::string &user_text,
                                              const std::string &assistant_text) {
      const auto recorded = store->record_turn(session_id, turn_id, user_text, assistant_text);
      if (!recorded.ok()) {
        observability::record_error("transcripts", recorded.error());
      }
    };
  }

  auto enricher = session::create_enricher(options);
  if (!enricher.ok()) {
    return common::Result<std::unique_ptr<session::Session>>::failure(enricher.error());
  }

  session::SpeechSinkFactory speech_factory;
  if (tts_engine_ != nullptr && audio != nullptr) {
    auto engine = tts_engine_;
    speech_factory = [engine, audio](events::IEventPublisher &publisher) {
      return std::make_unique<tts::TtsSpeechSink>(engine, *audio, publisher,
                                                  tts::TtsSinkOptions{.provider = "system"});
    };
  }

  return common::Result<std::unique_ptr<session::Session>>::success(
      std::make_unique<session::Session>(std::move(options), enricher.value(), generator_, channel,
                                         std::move(speech_factory)));
}

gateway::GatewayOptions RuntimeContext::gateway_options() const {
  gateway::GatewayOptions options;
  options.host = config_.server.host;
  options.port = config_.server.port;
  options.path = config_.server.path;
  options.max_connections = config_.server.max_connections;
  options.tls_enabled = config_.server.tls_enabled;
  options.tls_cert_file = config_.server.tls_cert_file;
  options.tls_key_file = config_.server.tls_key_file;
  options.session_factory = [this](const gateway::ConnectionInfo &info,
                                   gateway::ClientConnection &connection) {
    return create_session(info.peer, connection, &connection);
  };
  return options;
}

} // namespace voxrelay::runtime
