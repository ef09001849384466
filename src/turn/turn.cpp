#include "voxrelay/turn/turn.hpp"

#include "voxrelay/common/fs.hpp"

namespace voxrelay::turn {

std::string_view controller_state_name(const ControllerState state) {
  switch (state) {
  case ControllerState::Idle:
    return "idle";
  case ControllerState::Pending:
    return "pending";
  case ControllerState::Streaming:
    return "streaming";
  case ControllerState::Committing:
    return "committing";
  case ControllerState::Cancelled:
    return "cancelled";
  }
  return "idle";
}

std::string_view turn_status_name(const TurnStatus status) {
  switch (status) {
  case TurnStatus::Pending:
    return "pending";
  case TurnStatus::Streaming:
    return "streaming";
  case TurnStatus::Complete:
    return "complete";
  case TurnStatus::Cancelled:
    return "cancelled";
  }
  return "pending";
}

std::string_view cancel_reason_name(const CancelReason reason) {
  switch (reason) {
  case CancelReason::BargeIn:
    return "barge_in";
  case CancelReason::Teardown:
    return "teardown";
  case CancelReason::GenerationFailure:
    return "generation_failure";
  case CancelReason::Superseded:
    return "superseded";
  case CancelReason::TransportFailure:
    return "transport_failure";
  case CancelReason::Explicit:
    return "explicit";
  }
  return "explicit";
}

std::string_view turn_outcome_name(const TurnOutcome outcome) {
  switch (outcome) {
  case TurnOutcome::Completed:
    return "completed";
  case TurnOutcome::Cancelled:
    return "cancelled";
  case TurnOutcome::Failed:
    return "failed";
  }
  return "completed";
}

std::string_view submit_result_name(const SubmitResult result) {
  switch (result) {
  case SubmitResult::Started:
    return "started";
  case SubmitResult::Queued:
    return "queued";
  case SubmitResult::RejectedEmpty:
    return "rejected_empty";
  case SubmitResult::RejectedBusy:
    return "rejected_busy";
  case SubmitResult::RejectedStopped:
    return "rejected_stopped";
  }
  return "rejected_stopped";
}

std::optional<ConcurrentTurnPolicy> parse_concurrent_policy(const std::string_view text) {
  const std::string normalized = common::to_lower(common::trim(std::string(text)));
  if (normalized.empty() || normalized == "cancel_active" || normalized == "cancel-active") {
    return ConcurrentTurnPolicy::CancelActive;
  }
  if (normalized == "drop_new" || normalized == "drop-new") {
    return ConcurrentTurnPolicy::DropNew;
  }
  return std::nullopt;
}

std::string_view concurrent_policy_name(const ConcurrentTurnPolicy policy) {
  return policy == ConcurrentTurnPolicy::DropNew ? "drop_new" : "cancel_active";
}

} // namespace voxrelay::turn
