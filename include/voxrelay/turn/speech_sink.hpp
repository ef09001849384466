#pragma once

#include "voxrelay/common/cancellation.hpp"
#include "voxrelay/common/result.hpp"
#include "voxrelay/turn/turn.hpp"

#include <cstdint>

namespace voxrelay::turn {

/// Downstream text-to-speech collaborator. Calls for one session arrive from a
/// single thread, always as begin_turn, speak*, end_turn.
class ISpeechSink {
public:
  virtual ~ISpeechSink() = default;

  virtual void begin_turn(const TurnStart &start) = 0;

  /// May block on backpressure. An error status is treated as a transport failure
  /// and cancels the turn.
  [[nodiscard]] virtual common::Status speak(const Fragment &fragment,
                                             const common::CancellationToken &token) = 0;

  virtual void end_turn(const TurnEnd &end) = 0;

  /// Aborts an in-flight `speak` of turn `turn_id` from another thread. A request
  /// naming a turn that already ended must not affect later turns. Returns false
  /// when the sink cannot abort, in which case the current fragment runs to completion.
  virtual bool interrupt(std::uint64_t turn_id) {
    (void)turn_id;
    return false;
  }
};

} // namespace voxrelay::turn
