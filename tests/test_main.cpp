#include <iostream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "test_support.hpp"

int main() {
  spdlog::set_level(spdlog::level::off);
  try {
    tether_test::session_tests();
    tether_test::session_manager_tests();
    tether_test::session_protocol_tests();
    tether_test::session_interceptor_tests();
    tether_test::invocation_tests();
    std::cout << "tether_tests: all tests passed\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "tether_tests: failure: " << ex.what() << "\n";
    return 1;
  }
}
