#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<gembridge::tests::TestCase> &tests);
void register_config_tests(std::vector<gembridge::tests::TestCase> &tests);
void register_observability_tests(std::vector<gembridge::tests::TestCase> &tests);
void register_event_interpreter_tests(std::vector<gembridge::tests::TestCase> &tests);
void register_stream_tests(std::vector<gembridge::tests::TestCase> &tests);
void register_request_tests(std::vector<gembridge::tests::TestCase> &tests);
void register_supervisor_tests(std::vector<gembridge::tests::TestCase> &tests);
void register_mcp_tests(std::vector<gembridge::tests::TestCase> &tests);
void register_client_integration_tests(std::vector<gembridge::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<gembridge::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_event_interpreter_tests(tests);
  register_stream_tests(tests);
  register_request_tests(tests);
  register_supervisor_tests(tests);
  register_mcp_tests(tests);
  register_client_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";
  return failed == 0 ? 0 : 1;
}
