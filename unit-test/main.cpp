#include <curl/curl.h>
#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // docker::client 依赖 libcurl 的全局状态
    ASSERT_EQ(curl_global_init(CURL_GLOBAL_ALL), CURLE_OK);
  }
  virtual void TearDown() {
    curl_global_cleanup();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;
  FLAGS_minloglevel = google::GLOG_WARNING;

  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
