#include <glog/logging.h>
#include <filesystem>
#include "common/utils.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 每次测试使用独立的临时目录，避免与正在运行的评测引擎冲突
    grader::SCRATCH_DIR = std::filesystem::temp_directory_path() / ("exercise-grader-test-" + grader::random_id());
    std::filesystem::create_directories(grader::SCRATCH_DIR);
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(grader::SCRATCH_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
