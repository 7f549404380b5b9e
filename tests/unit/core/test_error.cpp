#include <gtest/gtest.h>
#include <string>

#include <cuproof/core/error.h>
#include <cuproof/core/log.h>

#include "utils/test_macros.h"

namespace {

error_t inner_func() { return cuproof::error(E_BADARG, "inner error msg"); }

error_t outer_func() {
  error_t rv = UNINITIALIZED_ERROR;
  if (rv = inner_func()) return cuproof::error(rv, "outer error msg");
  return SUCCESS;
}

std::string captured_log;
void capture_log(int mode, const char* str) { captured_log += str; }

TEST(ErrorTest, TestErrorLogsWithCallback) {
  cuproof::set_test_error_storing_mode(true);

  cuproof::error(E_BADARG, "This is a test of E_BADARG");

  EXPECT_FALSE(cuproof::g_test_log_str.empty());
  EXPECT_NE(std::string::npos, cuproof::g_test_log_str.find("This is a test of E_BADARG"));
}

TEST(ErrorTest, TestErrorNoMessage) {
  captured_log.clear();
  cuproof::out_log_fun = capture_log;
  cuproof::error(E_BADARG);
  cuproof::out_log_fun = nullptr;

  EXPECT_NE(std::string::npos, captured_log.find("Error 0xff010002"));
  EXPECT_EQ(std::string::npos, captured_log.find(": "));
}

TEST(ErrorTest, TestLayeredErrorMsgs) {
  cuproof::set_test_error_storing_mode(true);

  EXPECT_ER_MSG(outer_func(), "inner error msg; outer error msg");
}

TEST(ErrorTest, ErrorCodeIsReturned) {
  EXPECT_EQ(cuproof::error(E_FORMAT, "bad"), E_FORMAT);
  EXPECT_EQ(ECATEGORY(E_FILE), ECATEGORY_FILE);
  EXPECT_EQ(ECATEGORY(E_RANGE), ECATEGORY_GENERIC);
}

TEST(ErrorTest, LogSinkReceivesFrames) {
  captured_log.clear();
  cuproof::out_log_fun = capture_log;
  {
    int index = 7;
    std::string name = "proof.txt";
    LOG_FRAME(LOG(index), LOG(name));
    cuproof::error(E_NOT_FOUND, "missing");
  }
  cuproof::out_log_fun = nullptr;

  EXPECT_NE(std::string::npos, captured_log.find("index=7"));
  EXPECT_NE(std::string::npos, captured_log.find("proof.txt"));
  EXPECT_NE(std::string::npos, captured_log.find("Error 0xff010006: missing"));
}

TEST(ErrorTest, DisableScopeSilencesLog) {
  captured_log.clear();
  cuproof::out_log_fun = capture_log;
  {
    dylog_disable_scope_t no_log_scope;
    EXPECT_EQ(cuproof::error(E_GENERAL, "hidden"), E_GENERAL);
  }
  cuproof::out_log_fun = nullptr;
  EXPECT_TRUE(captured_log.empty());
}

TEST(ErrorTest, AssertThrows) {
  dylog_disable_scope_t no_log_scope;
  EXPECT_CP_ASSERT(cp_assert(1 == 2), "1 == 2");
}

}  // namespace
