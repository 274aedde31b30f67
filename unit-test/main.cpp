#include <glog/logging.h>
#include <memory>
#include "common/python.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

static std::unique_ptr<python_runtime> python;

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    python = std::make_unique<python_runtime>("sandbox-test");
  }
  virtual void TearDown() {
    python.reset();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
