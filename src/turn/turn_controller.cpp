#include "voxrelay/turn/turn_controller.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/events/event.hpp"
#include "voxrelay/observability/global.hpp"

#include <exception>

namespace voxrelay::turn {

namespace {

using FragmentResult = common::Result<std::optional<std::string>>;

FragmentResult pull_fragment(response::IFragmentStream &stream,
                             const common::CancellationToken &token) {
  try {
    return stream.next(token);
  } catch (const std::exception &ex) {
    return FragmentResult::failure(std::string("generator raised: ") + ex.what());
  }
}

} // namespace

TurnController::TurnController(conversation::ConversationState &conversation,
                               std::shared_ptr<response::IResponseGenerator> generator,
                               ISpeechSink &speech, events::IEventPublisher &events,
                               TurnControllerOptions options)
    : conversation_(conversation), generator_(std::move(generator)), speech_(speech),
      events_(events), options_(std::move(options)) {}

TurnController::~TurnController() { stop(); }

void TurnController::start() {
  if (running_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }
  worker_ = std::thread([this] { worker_loop(); });
}

void TurnController::stop() {
  std::optional<std::uint64_t> interrupted_turn;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    held_utterance_.reset();
    if (active_.has_value()) {
      interrupted_turn = active_->id;
      request_cancel_locked(CancelReason::Teardown);
    }
  }
  cv_.notify_all();
  if (interrupted_turn.has_value()) {
    (void)speech_.interrupt(*interrupted_turn);
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  running_ = false;
}

void TurnController::set_commit_hook(CommitHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  commit_hook_ = std::move(hook);
}

void TurnController::open_turn_locked(std::string utterance) {
  last_turn_id_ += 1;
  active_ = Turn{.id = last_turn_id_, .status = TurnStatus::Pending, .user_text = std::move(utterance)};
  state_ = ControllerState::Pending;
  cancel_reason_.reset();
  cancel_source_ = common::CancellationSource();
}

void TurnController::request_cancel_locked(const CancelReason reason) {
  if (!active_.has_value() || state_ == ControllerState::Committing ||
      state_ == ControllerState::Cancelled) {
    return;
  }
  cancel_reason_ = reason;
  state_ = ControllerState::Cancelled;
  active_->status = TurnStatus::Cancelled;
  cancel_source_.cancel();
}

SubmitResult TurnController::submit_utterance(const std::string &text) {
  std::string utterance = common::trim(text);
  if (utterance.empty()) {
    observability::record_turn_rejected(options_.session_id, "empty utterance");
    return SubmitResult::RejectedEmpty;
  }

  std::optional<std::uint64_t> interrupted_turn;
  SubmitResult result = SubmitResult::Started;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || !running_.load()) {
      result = SubmitResult::RejectedStopped;
    } else if (state_ == ControllerState::Idle && !active_.has_value()) {
      open_turn_locked(std::move(utterance));
    } else if (options_.concurrent_policy == ConcurrentTurnPolicy::DropNew) {
      result = SubmitResult::RejectedBusy;
    } else {
      held_utterance_ = std::move(utterance);
      if (state_ == ControllerState::Pending || state_ == ControllerState::Streaming) {
        interrupted_turn = active_->id;
      }
      request_cancel_locked(CancelReason::Superseded);
      result = SubmitResult::Queued;
    }
  }

  switch (result) {
  case SubmitResult::Started:
    cv_.notify_all();
    break;
  case SubmitResult::Queued:
    if (interrupted_turn.has_value()) {
      (void)speech_.interrupt(*interrupted_turn);
    }
    break;
  case SubmitResult::RejectedBusy:
    observability::record_turn_rejected(options_.session_id, "turn in flight");
    break;
  case SubmitResult::RejectedStopped:
    observability::record_turn_rejected(options_.session_id, "controller stopped");
    break;
  case SubmitResult::RejectedEmpty:
    break;
  }
  return result;
}

bool TurnController::cancel(const CancelReason reason) {
  std::uint64_t interrupted_turn = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_.has_value() || state_ == ControllerState::Committing ||
        state_ == ControllerState::Cancelled) {
      return false;
    }
    interrupted_turn = active_->id;
    request_cancel_locked(reason);
  }
  // The turn id keeps a late interrupt from muting the turn that follows.
  (void)speech_.interrupt(interrupted_turn);
  return true;
}

ControllerState TurnController::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<Turn> TurnController::active_turn() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

std::uint64_t TurnController::last_turn_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_turn_id_;
}

conversation::History TurnController::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return conversation_.turns();
}

bool TurnController::wait_until_idle(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] {
    return state_ == ControllerState::Idle && !active_.has_value() && !held_utterance_.has_value();
  });
}

void TurnController::worker_loop() {
  while (true) {
    std::uint64_t turn_id = 0;
    std::string utterance;
    common::CancellationToken token;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || (active_.has_value() && !turn_running_); });
      if (!active_.has_value()) {
        return;
      }
      turn_running_ = true;
      turn_id = active_->id;
      utterance = active_->user_text;
      token = cancel_source_.token();
    }

    run_turn(turn_id, utterance, token);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      turn_running_ = false;
      active_.reset();
      if (held_utterance_.has_value() && !stopping_) {
        std::string next = std::move(*held_utterance_);
        held_utterance_.reset();
        open_turn_locked(std::move(next));
      } else {
        held_utterance_.reset();
        state_ = ControllerState::Idle;
      }
    }
    cv_.notify_all();
  }
}

void TurnController::run_turn(const std::uint64_t turn_id, const std::string &utterance,
                              const common::CancellationToken &token) {
  const auto started_at = std::chrono::steady_clock::now();

  response::GenerationInput input;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    input.system_prompt = conversation_.system_prompt();
    input.history = conversation_.turns();
    input.utterance = utterance;
  }

  speech_.begin_turn(TurnStart{.turn_id = turn_id, .user_text = utterance});
  events_.publish(events::make_event(events::EventKind::BotLlmStarted));
  observability::record_event(
      observability::TurnStartEvent{.session_id = options_.session_id, .turn_id = turn_id});

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ControllerState::Pending) {
      state_ = ControllerState::Streaming;
      active_->status = TurnStatus::Streaming;
    }
    if (const auto appended = conversation_.append(conversation::Role::User, utterance);
        !appended.ok()) {
      observability::record_error("turn", appended.error());
    }
  }

  std::unique_ptr<response::IFragmentStream> stream;
  std::optional<std::string> failure;
  try {
    stream = generator_->generate(input);
  } catch (const std::exception &ex) {
    failure = std::string("generator raised: ") + ex.what();
  }
  if (!failure.has_value() && stream == nullptr) {
    failure = "generator returned no stream";
  }

  std::string accumulated;
  std::size_t sequence = 0;
  bool exhausted = false;
  bool transport_failed = false;

  while (!failure.has_value() && !token.cancelled()) {
    auto next = pull_fragment(*stream, token);
    if (!next.ok()) {
      failure = next.error();
      break;
    }
    if (token.cancelled()) {
      break;
    }
    if (!next.value().has_value()) {
      exhausted = true;
      break;
    }
    std::string text = std::move(*next.value());
    if (text.empty()) {
      continue;
    }

    accumulated += text;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      active_->accumulated_text = accumulated;
    }
    if (sequence == 0) {
      observability::record_metric(observability::FirstFragmentLatencyMetric{
          .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - started_at)});
    }

    events_.publish(events::make_bot_llm_text(text));
    const auto spoken = speech_.speak(
        Fragment{.turn_id = turn_id, .sequence = sequence, .text = std::move(text)}, token);
    if (!spoken.ok()) {
      if (!token.cancelled()) {
        transport_failed = true;
        observability::record_error("turn", "speech sink failed: " + spoken.error());
        std::lock_guard<std::mutex> lock(mutex_);
        request_cancel_locked(CancelReason::TransportFailure);
      }
      break;
    }
    ++sequence;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      active_->fragments_forwarded = sequence;
    }
  }

  TurnEnd end{.turn_id = turn_id, .fragments = sequence};
  std::optional<std::string> committed_text;
  CommitHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool cancelled = token.cancelled() || state_ == ControllerState::Cancelled;
    if (exhausted && !cancelled && !transport_failed) {
      state_ = ControllerState::Committing;
      common::Status committed = common::Status::success();
      // A reply of whitespace only completes like an empty one: nothing to remember.
      if (common::trim(accumulated).empty()) {
        accumulated.clear();
      } else {
        committed = conversation_.append(conversation::Role::Assistant, accumulated);
      }
      if (committed.ok()) {
        active_->status = TurnStatus::Complete;
        end.outcome = TurnOutcome::Completed;
        committed_text = accumulated;
        hook = commit_hook_;
      } else {
        failure = "commit failed: " + committed.error();
      }
    }
    if (!committed_text.has_value()) {
      active_->status = TurnStatus::Cancelled;
      state_ = ControllerState::Cancelled;
      if (failure.has_value() && !cancelled) {
        end.outcome = TurnOutcome::Failed;
        end.reason = CancelReason::GenerationFailure;
      } else {
        end.outcome = TurnOutcome::Cancelled;
        end.reason = cancel_reason_.value_or(CancelReason::Explicit);
      }
    }
  }

  if (failure.has_value() && end.outcome == TurnOutcome::Failed) {
    observability::record_event(observability::GenerationFailureEvent{
        .session_id = options_.session_id,
        .turn_id = turn_id,
        .fragments_forwarded = sequence,
        .message = *failure});
  }
  if (committed_text.has_value() && hook) {
    hook(turn_id, utterance, *committed_text);
  }

  speech_.end_turn(end);
  events_.publish(events::make_event(events::EventKind::BotLlmStopped));
  observability::record_event(observability::TurnEndEvent{
      .session_id = options_.session_id,
      .turn_id = turn_id,
      .outcome = std::string(turn_outcome_name(end.outcome)),
      .reason = end.reason.has_value() ? std::string(cancel_reason_name(*end.reason)) : "",
      .fragments = end.fragments,
      .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started_at)});

  // Releasing a remote stream can block until its transfer unwinds; the end
  // boundary is already out by then.
  stream.reset();
}

} // namespace voxrelay::turn
