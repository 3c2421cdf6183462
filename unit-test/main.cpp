#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/sandbox_env.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    codejudge::setup_test_environment();
  }
  virtual void TearDown() {
    codejudge::teardown_test_environment();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
