#pragma once

#include "voxrelay/common/cancellation.hpp"
#include "voxrelay/common/result.hpp"
#include "voxrelay/conversation/conversation_state.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxrelay::response {

/// Everything a generator may look at. `history` does not include `utterance`.
struct GenerationInput {
  std::string system_prompt;
  conversation::History history;
  std::string utterance;
};

/// One-shot, ordered sequence of non-empty text fragments.
///
/// `next` blocks until a fragment is available, the sequence is exhausted
/// (nullopt), or the upstream failed (error). It also returns nullopt early when
/// `token` is cancelled while waiting, so callers re-check the token after each
/// call. Dropping the stream at any point releases its upstream work.
class IFragmentStream {
public:
  virtual ~IFragmentStream() = default;

  [[nodiscard]] virtual common::Result<std::optional<std::string>>
  next(const common::CancellationToken &token) = 0;
};

/// Produces a fragment stream per utterance. Implementations hold no per-session
/// state and may be shared by every session of the process.
class IResponseGenerator {
public:
  virtual ~IResponseGenerator() = default;

  [[nodiscard]] virtual std::unique_ptr<IFragmentStream> generate(const GenerationInput &input) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Replays a fixed list of fragments.
class StaticFragmentStream final : public IFragmentStream {
public:
  explicit StaticFragmentStream(std::vector<std::string> fragments);

  [[nodiscard]] common::Result<std::optional<std::string>>
  next(const common::CancellationToken &token) override;

private:
  std::vector<std::string> fragments_;
  std::size_t position_ = 0;
};

} // namespace voxrelay::response
