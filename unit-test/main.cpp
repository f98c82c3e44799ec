#include <glog/logging.h>
#include "common/python.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

// 沙箱测试和调度器测试共用同一个内嵌解释器，整个测试进程只初始化一次
class GlobalEnv : public ::testing::Environment {
 public:
  void SetUp() override {
    runbox::python_interpreter::initialize();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
