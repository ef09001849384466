#include "voxrelay/tts/speech_sink.hpp"

#include "voxrelay/events/event.hpp"

namespace voxrelay::tts {

TtsSpeechSink::TtsSpeechSink(std::shared_ptr<TtsEngine> engine, IAudioOutput &audio,
                             events::IEventPublisher &events, TtsSinkOptions options)
    : engine_(std::move(engine)), audio_(audio), events_(events), options_(std::move(options)) {}

void TtsSpeechSink::begin_turn(const turn::TurnStart &) {}

common::Status TtsSpeechSink::speak(const turn::Fragment &fragment,
                                    const common::CancellationToken &token) {
  events_.publish(events::make_bot_tts_text(fragment.text));
  if (interrupted_turn_.load() == fragment.turn_id || token.cancelled()) {
    return common::Status::success();
  }
  // Whitespace-only fragments carry no speech.
  if (fragment.text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return common::Status::success();
  }

  auto audio = engine_->synthesize(
      TtsRequest{.text = fragment.text, .voice = options_.voice, .speed = options_.speed},
      options_.provider);
  if (!audio.ok()) {
    return common::Status::error("synthesis failed: " + audio.error());
  }
  if (interrupted_turn_.load() == fragment.turn_id || token.cancelled()) {
    return common::Status::success();
  }

  const auto sent = audio_.send_audio(AudioChunk{.turn_id = fragment.turn_id,
                                                 .sequence = fragment.sequence,
                                                 .mime_type = audio.value().mime_type,
                                                 .bytes = std::move(audio.value().bytes)});
  if (!sent.ok()) {
    return sent;
  }
  ++chunks_sent_;
  return common::Status::success();
}

void TtsSpeechSink::end_turn(const turn::TurnEnd &end) {
  std::uint64_t expected = end.turn_id;
  (void)interrupted_turn_.compare_exchange_strong(expected, 0);
}

bool TtsSpeechSink::interrupt(const std::uint64_t turn_id) {
  interrupted_turn_ = turn_id;
  return true;
}

common::Status NullSpeechSink::speak(const turn::Fragment &fragment,
                                         const common::CancellationToken &) {
  events_.publish(events::make_bot_tts_text(fragment.text));
  return common::Status::success();
}

} // namespace voxrelay::tts
