#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "clicker_log.h"

using namespace Clicker;

namespace {

std::vector<std::string> captured;
void captureSink(const char* line) { captured.push_back(line); }

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    captured.clear();
    Log::setSink(captureSink);
    Log::setDebug(false);
  }
  void TearDown() override {
    Log::setSink(nullptr);
    Log::setDebug(false);
  }
};

} // namespace

TEST_F(LogTest, InfoIsFormatted) {
  Log::info("High score: %lu", 42ul);
  ASSERT_EQ(1u, captured.size());
  EXPECT_EQ("High score: 42", captured[0]);
}

TEST_F(LogTest, DebugOnlyWhenEnabled) {
  Log::debug("hidden %d", 1);
  EXPECT_TRUE(captured.empty());

  Log::setDebug(true);
  EXPECT_TRUE(Log::debugEnabled());
  Log::debug("shown %d", 2);
  ASSERT_EQ(1u, captured.size());
  EXPECT_EQ("shown 2", captured[0]);
}

TEST_F(LogTest, LongLinesAreTruncated) {
  const std::string longText(400, 'x');
  Log::info("%s", longText.c_str());
  ASSERT_EQ(1u, captured.size());
  EXPECT_EQ(159u, captured[0].size());
}

TEST_F(LogTest, NoSinkIsSilent) {
  Log::setSink(nullptr);
  Log::info("dropped");
  Log::setDebug(true);
  Log::debug("dropped");
  EXPECT_TRUE(captured.empty());
}
