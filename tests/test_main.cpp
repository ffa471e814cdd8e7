#include "test_framework.hpp"

#include <iostream>

void register_common_tests(std::vector<sessionkit::tests::TestCase> &tests);
void register_context_tests(std::vector<sessionkit::tests::TestCase> &tests);
void register_entropy_tests(std::vector<sessionkit::tests::TestCase> &tests);
void register_id_generator_tests(std::vector<sessionkit::tests::TestCase> &tests);
void register_create_session_tests(std::vector<sessionkit::tests::TestCase> &tests);
void register_store_tests(std::vector<sessionkit::tests::TestCase> &tests);
void register_config_tests(std::vector<sessionkit::tests::TestCase> &tests);
void register_observability_tests(std::vector<sessionkit::tests::TestCase> &tests);
void register_cli_tests(std::vector<sessionkit::tests::TestCase> &tests);
void register_sessions_integration_tests(std::vector<sessionkit::tests::TestCase> &tests);

int main(int argc, char **argv) {
  std::vector<sessionkit::tests::TestCase> tests;
  register_common_tests(tests);
  register_context_tests(tests);
  register_entropy_tests(tests);
  register_id_generator_tests(tests);
  register_create_session_tests(tests);
  register_store_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);
  register_sessions_integration_tests(tests);

  // Optional substring filter: sessionkit_tests <pattern>
  const std::string filter = argc > 1 ? argv[1] : "";

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
