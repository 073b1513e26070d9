#include "erasurecore/logger.h"
#include <filesystem>
#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path logDir = fs::temp_directory_path() / "erasurecore_test_logs";
  fs::create_directories(logDir);

  // Initialize the logger for tests
  try {
    erasurecore::Logger::init((logDir / "erasurecore_tests.log").string(),
                              erasurecore::LogLevel::DEBUG);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
