#pragma once

#include "voxrelay/config/schema.hpp"
#include "voxrelay/events/forwarder.hpp"
#include "voxrelay/observability/observer.hpp"
#include "voxrelay/response/generator.hpp"
#include "voxrelay/tts/speech_sink.hpp"
#include "voxrelay/turn/speech_sink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace voxrelay::testing {

inline constexpr auto kWaitTimeout = std::chrono::milliseconds(3000);

/// Offline configuration: template generator, no TTS, no transcripts, no logging.
config::Config mock_config();

/// What one `generate` call streams.
struct GeneratorScript {
  std::vector<std::string> fragments;
  /// Returned after the fragments instead of end-of-stream.
  std::optional<std::string> error;
  /// After the fragments, wait until the turn is cancelled.
  bool hang = false;
  /// Pause before every fragment; cancellation cuts it short.
  std::chrono::milliseconds delay{0};
  /// `generate` itself throws.
  bool throw_on_generate = false;
};

/// Replays scripts in order, repeating the last one. Records every input and
/// counts streams that were released.
class ScriptedGenerator final : public response::IResponseGenerator {
public:
  explicit ScriptedGenerator(std::vector<GeneratorScript> scripts);

  [[nodiscard]] std::unique_ptr<response::IFragmentStream>
  generate(const response::GenerationInput &input) override;
  [[nodiscard]] std::string_view name() const override { return "scripted"; }

  [[nodiscard]] std::vector<response::GenerationInput> inputs() const;
  [[nodiscard]] std::size_t released_streams() const { return released_->load(); }
  /// Blocks until `count` streams have been handed out.
  bool wait_for_streams(std::size_t count, std::chrono::milliseconds timeout = kWaitTimeout) const;

private:
  std::vector<GeneratorScript> scripts_;
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::vector<response::GenerationInput> inputs_;
  std::shared_ptr<std::atomic<std::size_t>> released_;
};

/// Convenience for the common single-script case.
std::shared_ptr<ScriptedGenerator> make_generator(std::vector<std::string> fragments);

/// Records every speech call in order, e.g. "begin:1", "speak:1:0:Hi", "end:1:completed".
class RecordingSpeechSink final : public turn::ISpeechSink {
public:
  void begin_turn(const turn::TurnStart &start) override;
  [[nodiscard]] common::Status speak(const turn::Fragment &fragment,
                                     const common::CancellationToken &token) override;
  void end_turn(const turn::TurnEnd &end) override;
  bool interrupt(std::uint64_t turn_id) override;

  /// Every `speak` after this fails with `message`.
  void fail_speak(std::string message);

  [[nodiscard]] std::vector<std::string> calls() const;
  [[nodiscard]] std::vector<turn::Fragment> fragments() const;
  [[nodiscard]] std::vector<turn::TurnEnd> ends() const;
  [[nodiscard]] std::size_t interrupts() const { return interrupts_.load(); }
  [[nodiscard]] std::vector<std::uint64_t> interrupted_turns() const;
  bool wait_for_ends(std::size_t count, std::chrono::milliseconds timeout = kWaitTimeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::vector<std::string> calls_;
  std::vector<turn::Fragment> fragments_;
  std::vector<turn::TurnEnd> ends_;
  std::optional<std::string> speak_error_;
  std::atomic<std::size_t> interrupts_{0};
  std::vector<std::uint64_t> interrupted_turns_;
};

/// Shared event log behind the recording publisher and channel.
class EventLog {
public:
  void add(events::OutboundEvent event);

  [[nodiscard]] std::vector<events::OutboundEvent> events() const;
  [[nodiscard]] std::vector<events::EventKind> kinds() const;
  [[nodiscard]] std::size_t count(events::EventKind kind) const;
  bool wait_for(events::EventKind kind, std::size_t count,
                std::chrono::milliseconds timeout = kWaitTimeout) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::vector<events::OutboundEvent> events_;
};

class RecordingPublisher final : public events::IEventPublisher {
public:
  void publish(events::OutboundEvent event) override { log.add(std::move(event)); }

  EventLog log;
};

/// Urgent channel double. `block()` holds every send until `unblock()`.
class RecordingChannel final : public events::IEventChannel {
public:
  [[nodiscard]] common::Status send_urgent(const events::OutboundEvent &event) override;

  void block();
  void unblock();
  void fail_sends(bool fail);

  EventLog log;

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool blocked_ = false;
  std::atomic<bool> fail_{false};
};

class RecordingAudioOutput final : public tts::IAudioOutput {
public:
  [[nodiscard]] common::Status send_audio(const tts::AudioChunk &chunk) override;

  [[nodiscard]] std::vector<tts::AudioChunk> chunks() const;

private:
  mutable std::mutex mutex_;
  std::vector<tts::AudioChunk> chunks_;
};

/// Collects observer events for assertions.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::size_t metric_count() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::size_t metrics_ = 0;
};

/// Installs a RecordingObserver globally for its lifetime.
class ObserverScope {
public:
  ObserverScope();
  ~ObserverScope();

  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  std::filesystem::path create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Sets or clears environment variables and restores the previous values.
class EnvGuard {
public:
  EnvGuard() = default;
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

  void set(const std::string &name, const std::string &value);
  void unset(const std::string &name);

private:
  void remember(const std::string &name);

  std::vector<std::pair<std::string, std::optional<std::string>>> saved_;
};

/// Polls `condition` until it holds or the timeout expires.
bool wait_until(const std::function<bool()> &condition,
                std::chrono::milliseconds timeout = kWaitTimeout);

/// String member of the event's `data` section, or "" when absent.
std::string data_string(const events::OutboundEvent &event, const std::string &key);

} // namespace voxrelay::testing
