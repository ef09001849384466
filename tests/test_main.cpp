#include "test_framework.hpp"

#include "voxrelay/observability/global.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_events_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_enricher_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_forwarder_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_conversation_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_response_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_turn_controller_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_session_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_tts_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_config_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_transcripts_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_gateway_tests(std::vector<voxrelay::tests::TestCase> &tests);
void register_observability_tests(std::vector<voxrelay::tests::TestCase> &tests);

int main(int argc, char **argv) {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);
  // Diagnostics stay off unless a test installs its own observer.
  voxrelay::observability::set_global_observer(nullptr);

  const std::string filter = argc > 1 ? argv[1] : "";

  std::vector<voxrelay::tests::TestCase> tests;
  register_common_tests(tests);
  register_events_tests(tests);
  register_enricher_tests(tests);
  register_forwarder_tests(tests);
  register_conversation_tests(tests);
  register_response_tests(tests);
  register_turn_controller_tests(tests);
  register_session_tests(tests);
  register_tts_tests(tests);
  register_config_tests(tests);
  register_transcripts_tests(tests);
  register_gateway_tests(tests);
  register_observability_tests(tests);

  std::size_t ran = 0;
  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    if (!filter.empty() && test.name.find(filter) == std::string::npos) {
      continue;
    }
    ++ran;
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << ran << " tests: " << passed << " passed, " << failed << " failed\n";

  return failed == 0 ? 0 : 1;
}
