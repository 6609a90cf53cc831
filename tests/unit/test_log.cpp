// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Logger Unit Tests                                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "tabula/log.hpp"

using namespace tabula;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = log::level(); }
    void TearDown() override { log::set_level(saved_); }

    log::Level saved_ = log::Level::Info;
};

TEST_F(LogTest, ParseLevelNames) {
    EXPECT_EQ(*log::parse_level("trace"), log::Level::Trace);
    EXPECT_EQ(*log::parse_level("DEBUG"), log::Level::Debug);
    EXPECT_EQ(*log::parse_level("info"), log::Level::Info);
    EXPECT_EQ(*log::parse_level("warning"), log::Level::Warn);
    EXPECT_EQ(*log::parse_level("error"), log::Level::Error);
    EXPECT_EQ(*log::parse_level("off"), log::Level::Off);
}

TEST_F(LogTest, ParseUnknownLevel) {
    auto level = log::parse_level("verbose");
    ASSERT_FALSE(level.has_value());
    EXPECT_EQ(level.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(LogTest, SetLevel) {
    log::set_level(log::Level::Off);
    EXPECT_EQ(log::level(), log::Level::Off);

    // Dropped without output
    log::error("suppressed {}", 1);

    log::set_level(log::Level::Debug);
    EXPECT_EQ(log::level(), log::Level::Debug);
}
