#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voxrelay::turn {

enum class ControllerState { Idle, Pending, Streaming, Committing, Cancelled };
enum class TurnStatus { Pending, Streaming, Complete, Cancelled };

/// Why a turn was cancelled.
enum class CancelReason {
  BargeIn,
  Teardown,
  GenerationFailure,
  Superseded,
  TransportFailure,
  Explicit,
};

enum class TurnOutcome { Completed, Cancelled, Failed };

/// What happens to an utterance that arrives while a turn is in flight.
enum class ConcurrentTurnPolicy {
  /// Cancel the active turn and run the newest utterance once it has ended.
  CancelActive,
  /// Keep the active turn and drop the utterance.
  DropNew,
};

enum class SubmitResult { Started, Queued, RejectedEmpty, RejectedBusy, RejectedStopped };

[[nodiscard]] std::string_view controller_state_name(ControllerState state);
[[nodiscard]] std::string_view turn_status_name(TurnStatus status);
[[nodiscard]] std::string_view cancel_reason_name(CancelReason reason);
[[nodiscard]] std::string_view turn_outcome_name(TurnOutcome outcome);
[[nodiscard]] std::string_view submit_result_name(SubmitResult result);
[[nodiscard]] std::optional<ConcurrentTurnPolicy> parse_concurrent_policy(std::string_view text);
[[nodiscard]] std::string_view concurrent_policy_name(ConcurrentTurnPolicy policy);

struct Turn {
  std::uint64_t id = 0;
  TurnStatus status = TurnStatus::Pending;
  std::string user_text;
  std::string accumulated_text;
  std::size_t fragments_forwarded = 0;
};

struct Fragment {
  std::uint64_t turn_id = 0;
  std::size_t sequence = 0;
  std::string text;
};

struct TurnStart {
  std::uint64_t turn_id = 0;
  std::string user_text;
};

/// Terminal boundary of a turn; sent exactly once for every TurnStart.
struct TurnEnd {
  std::uint64_t turn_id = 0;
  TurnOutcome outcome = TurnOutcome::Completed;
  std::optional<CancelReason> reason;
  std::size_t fragments = 0;
};

} // namespace voxrelay::turn
