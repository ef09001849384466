#include "voxrelay/response/generator.hpp"

namespace voxrelay::response {

StaticFragmentStream::StaticFragmentStream(std::vector<std::string> fragments)
    : fragments_(std::move(fragments)) {}

common::Result<std::optional<std::string>>
StaticFragmentStream::next(const common::CancellationToken &token) {
  using NextResult = common::Result<std::optional<std::string>>;
  if (token.cancelled() || position_ >= fragments_.size()) {
    return NextResult::success(std::nullopt);
  }
  return NextResult::success(fragments_[position_++]);
}

} // namespace voxrelay::response
