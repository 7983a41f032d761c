#ifndef FSTORE_TEST_UTILS_HPP
#define FSTORE_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include "logger/logger.hpp"

// Console logging at warning so test output stays readable
inline void init_test_logging() {
  fstore::logging::init_console_logging(fstore::logging::severity_level::warning);
}

inline std::filesystem::path unique_temp_dir(const std::string& prefix) {
  return std::filesystem::temp_directory_path() /
    (prefix + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
}

#endif // FSTORE_TEST_UTILS_HPP
