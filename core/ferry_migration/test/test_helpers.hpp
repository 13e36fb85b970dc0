// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_MIGRATION_TEST_HELPERS_HPP
#define FERRY_MIGRATION_TEST_HELPERS_HPP

#include <chrono>
#include <filesystem>
#include <string>

namespace ferry {
namespace migration {
namespace test {

namespace fs = std::filesystem;

/**
 * Create a temporary directory for testing
 */
inline std::string createTempDir(const std::string& prefix = "ferry_test_") {
  std::string dir = (fs::temp_directory_path() /
                     (prefix + std::to_string(
                                 std::chrono::steady_clock::now().time_since_epoch().count()
                               )))
                      .string();
  fs::create_directories(dir);
  return dir;
}

inline void removeTempDir(const std::string& dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
}

}  // namespace test
}  // namespace migration
}  // namespace ferry

#endif  // FERRY_MIGRATION_TEST_HELPERS_HPP
