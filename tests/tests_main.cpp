#include "test_helpers.h"
#include "utilities/logger.h"
#include <filesystem>
#include <gtest/gtest.h>
#include <iostream>

std::string g_testLogFile;

int main(int argc, char **argv) {
  namespace fs = std::filesystem;
  fs::path base = fs::temp_directory_path() / "xferpress_test_var";
  fs::create_directories(base / "logs");
  g_testLogFile = (base / "logs" / "xferpress_tests.log").string();

  // Initialize the logger for tests
  try {
    Logger::init(g_testLogFile, LogLevel::DEBUG);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Test initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
