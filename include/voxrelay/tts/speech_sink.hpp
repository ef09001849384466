#pragma once

#include "voxrelay/events/forwarder.hpp"
#include "voxrelay/tts/tts.hpp"
#include "voxrelay/turn/speech_sink.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace voxrelay::tts {

struct AudioChunk {
  std::uint64_t turn_id = 0;
  std::size_t sequence = 0;
  std::string mime_type;
  std::vector<std::uint8_t> bytes;
};

/// Audio half of the transport; frames are kept separate from UI events.
class IAudioOutput {
public:
  virtual ~IAudioOutput() = default;
  [[nodiscard]] virtual common::Status send_audio(const AudioChunk &chunk) = 0;
};

struct TtsSinkOptions {
  std::string provider;
  std::optional<std::string> voice;
  std::optional<double> speed;
};

/// Synthesizes each fragment as it arrives and ships the audio to the client.
/// `interrupt` drops the audio of the named turn instead of sending it.
class TtsSpeechSink final : public turn::ISpeechSink {
public:
  TtsSpeechSink(std::shared_ptr<TtsEngine> engine, IAudioOutput &audio,
                events::IEventPublisher &events, TtsSinkOptions options = {});

  void begin_turn(const turn::TurnStart &start) override;
  [[nodiscard]] common::Status speak(const turn::Fragment &fragment,
                                     const common::CancellationToken &token) override;
  void end_turn(const turn::TurnEnd &end) override;
  bool interrupt(std::uint64_t turn_id) override;

  [[nodiscard]] std::size_t chunks_sent() const { return chunks_sent_.load(); }

private:
  std::shared_ptr<TtsEngine> engine_;
  IAudioOutput &audio_;
  events::IEventPublisher &events_;
  TtsSinkOptions options_;
  // Id of the turn whose audio is dropped; 0 when none.
  std::atomic<std::uint64_t> interrupted_turn_{0};
  std::atomic<std::size_t> chunks_sent_{0};
};

/// Speech path used when synthesis is disabled: the text still reaches the UI.
class NullSpeechSink final : public turn::ISpeechSink {
public:
  explicit NullSpeechSink(events::IEventPublisher &events) : events_(events) {}

  void begin_turn(const turn::TurnStart &) override {}
  [[nodiscard]] common::Status speak(const turn::Fragment &fragment,
                                     const common::CancellationToken &token) override;
  void end_turn(const turn::TurnEnd &) override {}

private:
  events::IEventPublisher &events_;
};

} // namespace voxrelay::tts
