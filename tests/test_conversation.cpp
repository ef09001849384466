#include "test_framework.hpp"

#include "voxrelay/conversation/conversation_state.hpp"

void register_conversation_tests(std::vector<voxrelay::tests::TestCase> &tests) {
  using voxrelay::tests::require;
  namespace conversation = voxrelay::conversation;

  tests.push_back({"conversation_appends_in_order", [] {
                     conversation::ConversationState state("be brief");
                     require(state.append(conversation::Role::User, "hello").ok(), "append failed");
                     require(state.append(conversation::Role::Assistant, "Hi there").ok(),
                             "append failed");
                     require(state.size() == 2, "expected two entries");
                     require(state.turns()[0] ==
                                 conversation::ConversationEntry{conversation::Role::User, "hello"},
                             "first entry mismatch");
                     require(state.turns()[1].role == conversation::Role::Assistant &&
                                 state.turns()[1].text == "Hi there",
                             "second entry mismatch");
                     require(state.system_prompt() == "be brief", "system prompt mismatch");
                   }});

  tests.push_back({"conversation_rejects_blank_entries", [] {
                     conversation::ConversationState state;
                     const auto status = state.append(conversation::Role::Assistant, "  \n ");
                     require(!status.ok(), "blank entries must be rejected");
                     require(status.error().find("assistant") != std::string::npos,
                             "error should name the role");
                     require(state.empty(), "state should stay empty");
                   }});

  tests.push_back({"conversation_recent_window", [] {
                     conversation::ConversationState state;
                     for (int i = 0; i < 5; ++i) {
                       require(state.append(conversation::Role::User, "m" + std::to_string(i)).ok(),
                               "append failed");
                     }
                     const auto recent = state.recent(2);
                     require(recent.size() == 2 && recent[0].text == "m3" && recent[1].text == "m4",
                             "recent should keep the newest entries");
                     require(state.recent(0).size() == 5, "zero means everything");
                     require(state.recent(10).size() == 5, "oversized window returns everything");
                     require(conversation::role_name(conversation::Role::Assistant) == "assistant",
                             "role name mismatch");
                   }});
}
