#include "voxrelay/conversation/conversation_state.hpp"

#include "voxrelay/common/fs.hpp"

namespace voxrelay::conversation {

std::string_view role_name(const Role role) {
  return role == Role::Assistant ? "assistant" : "user";
}

ConversationState::ConversationState(std::string system_prompt)
    : system_prompt_(std::move(system_prompt)) {}

common::Status ConversationState::append(const Role role, std::string text) {
  if (common::trim(text).empty()) {
    return common::Status::error(std::string("refusing to append empty ") +
                                 std::string(role_name(role)) + " turn");
  }
  turns_.push_back(ConversationEntry{.role = role, .text = std::move(text)});
  return common::Status::success();
}

History ConversationState::recent(const std::size_t max_entries) const {
  if (max_entries == 0 || turns_.size() <= max_entries) {
    return turns_;
  }
  return History(turns_.end() - static_cast<std::ptrdiff_t>(max_entries), turns_.end());
}

} // namespace voxrelay::conversation
