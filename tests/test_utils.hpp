#ifndef PGS_MATCH_TEST_UTILS_HPP
#define PGS_MATCH_TEST_UTILS_HPP

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include "gtest/gtest.h"

namespace pgs_match_test {

inline std::string dataFile(const std::string &name) {
  return std::string(PGS_MATCH_TEST_DATA_DIR) + "/" + name;
}

// Path under the gtest temporary directory, unique per test.
inline std::string tempPath(const std::string &name) {
  const ::testing::TestInfo *info =
      ::testing::UnitTest::GetInstance()->current_test_info();
  std::string prefix = info == nullptr
                           ? std::string("pgs_match")
                           : std::string(info->test_suite_name()) + "_" +
                                 info->name();
  return ::testing::TempDir() + prefix + "_" + name;
}

inline void writeFile(const std::string &path, const std::string &content) {
  std::ofstream out(path);
  out << content;
}

inline std::string readFile(const std::string &path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

inline bool fileExists(const std::string &path) {
  std::ifstream in(path);
  return in.good();
}

} // namespace pgs_match_test

#endif // PGS_MATCH_TEST_UTILS_HPP
