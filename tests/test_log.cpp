#include <graph_util/log.hpp>
#include <gtest/gtest.h>

using graph_util::logger;
using graph_util::set_log_level;

namespace {

class LogLevelTest : public ::testing::Test {
protected:
    void TearDown() override { set_log_level("info"); }
};

} // namespace

TEST_F(LogLevelTest, KnownNamesApply) {
    EXPECT_TRUE(set_log_level("debug"));
    EXPECT_EQ(logger()->level(), spdlog::level::debug);
    EXPECT_TRUE(set_log_level("warn"));
    EXPECT_EQ(logger()->level(), spdlog::level::warn);
}

TEST_F(LogLevelTest, UnknownNameKeepsCurrentLevel) {
    ASSERT_TRUE(set_log_level("debug"));
    EXPECT_FALSE(set_log_level("verbose"));
    EXPECT_EQ(logger()->level(), spdlog::level::debug);
    EXPECT_FALSE(set_log_level(""));
    EXPECT_EQ(logger()->level(), spdlog::level::debug);
}

TEST_F(LogLevelTest, OffOnlyWhenAskedFor) {
    EXPECT_TRUE(set_log_level("off"));
    EXPECT_EQ(logger()->level(), spdlog::level::off);
}
