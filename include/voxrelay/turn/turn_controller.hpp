#pragma once

#include "voxrelay/common/cancellation.hpp"
#include "voxrelay/conversation/conversation_state.hpp"
#include "voxrelay/events/forwarder.hpp"
#include "voxrelay/response/generator.hpp"
#include "voxrelay/turn/speech_sink.hpp"
#include "voxrelay/turn/turn.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace voxrelay::turn {

struct TurnControllerOptions {
  ConcurrentTurnPolicy concurrent_policy = ConcurrentTurnPolicy::CancelActive;
  std::string session_id;
};

/// Called on the turn thread after a turn's assistant entry has been committed.
using CommitHook = std::function<void(std::uint64_t turn_id, const std::string &user_text,
                                      const std::string &assistant_text)>;

/// Drives one conversation turn at a time for a session.
///
/// Turns run on a dedicated thread. For every accepted utterance the controller
/// emits a TurnStart, forwards fragments in sequence order, and finishes with
/// exactly one TurnEnd, whatever the outcome. The assistant entry is appended to
/// the conversation only when the generator ran to completion without being
/// cancelled, and strictly before TurnEnd is emitted.
class TurnController {
public:
  TurnController(conversation::ConversationState &conversation,
                 std::shared_ptr<response::IResponseGenerator> generator, ISpeechSink &speech,
                 events::IEventPublisher &events, TurnControllerOptions options = {});
  ~TurnController();

  TurnController(const TurnController &) = delete;
  TurnController &operator=(const TurnController &) = delete;

  void start();
  /// Cancels any in-flight turn (teardown), discards a held utterance and waits
  /// for the turn thread to emit its final boundary.
  void stop();

  SubmitResult submit_utterance(const std::string &text);

  /// Requests cancellation of the pending or streaming turn. Returns false when
  /// there is nothing to cancel (idle, committing, or already cancelling).
  bool cancel(CancelReason reason);
  bool barge_in() { return cancel(CancelReason::BargeIn); }

  [[nodiscard]] ControllerState state() const;
  [[nodiscard]] std::optional<Turn> active_turn() const;
  [[nodiscard]] std::uint64_t last_turn_id() const;
  [[nodiscard]] conversation::History history() const;
  [[nodiscard]] bool is_running() const { return running_.load(); }
  [[nodiscard]] const TurnControllerOptions &options() const { return options_; }

  /// Blocks until no turn is active or held. Returns false on timeout.
  bool wait_until_idle(std::chrono::milliseconds timeout) const;

  void set_commit_hook(CommitHook hook);

private:
  void worker_loop();
  void run_turn(std::uint64_t turn_id, const std::string &utterance,
                const common::CancellationToken &token);
  void open_turn_locked(std::string utterance);
  void request_cancel_locked(CancelReason reason);

  conversation::ConversationState &conversation_;
  std::shared_ptr<response::IResponseGenerator> generator_;
  ISpeechSink &speech_;
  events::IEventPublisher &events_;
  TurnControllerOptions options_;
  CommitHook commit_hook_;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  ControllerState state_ = ControllerState::Idle;
  std::optional<Turn> active_;
  std::optional<std::string> held_utterance_;
  std::optional<CancelReason> cancel_reason_;
  common::CancellationSource cancel_source_;
  std::uint64_t last_turn_id_ = 0;
  bool turn_running_ = false;
  bool stopping_ = false;

  std::atomic<bool> running_{false};
  std::thread worker_;
};

} // namespace voxrelay::turn
