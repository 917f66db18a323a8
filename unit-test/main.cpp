#include <glog/logging.h>
#include <filesystem>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    auto root = std::filesystem::temp_directory_path() / "grader-test";
    grader::RUN_DIR = root / "run";
    grader::RESULT_DIR = root / "results";
    std::filesystem::create_directories(grader::RUN_DIR);
    std::filesystem::create_directories(grader::RESULT_DIR);
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::temp_directory_path() / "grader-test", ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
