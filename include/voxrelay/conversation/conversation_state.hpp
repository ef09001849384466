#pragma once

#include "voxrelay/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace voxrelay::conversation {

enum class Role { User, Assistant };

[[nodiscard]] std::string_view role_name(Role role);

struct ConversationEntry {
  Role role = Role::User;
  std::string text;

  bool operator==(const ConversationEntry &other) const = default;
};

using History = std::vector<ConversationEntry>;

/// Append-only transcript of one session. Entries never change once appended.
class ConversationState {
public:
  explicit ConversationState(std::string system_prompt = "");

  [[nodiscard]] common::Status append(Role role, std::string text);

  [[nodiscard]] const History &turns() const { return turns_; }
  [[nodiscard]] std::size_t size() const { return turns_.size(); }
  [[nodiscard]] bool empty() const { return turns_.empty(); }
  [[nodiscard]] const std::string &system_prompt() const { return system_prompt_; }

  /// Copy of the newest `max_entries` entries (all of them when 0).
  [[nodiscard]] History recent(std::size_t max_entries) const;

private:
  std::string system_prompt_;
  History turns_;
};

} // namespace voxrelay::conversation
