#include <gtest/gtest.h>
#include "logging.hpp"

using namespace kgviz;

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("error"), spdlog::level::err);
    EXPECT_FALSE(logging::parse_level("loud").has_value());
}

TEST(LoggingTest, SetLevelChangesSharedLogger) {
    auto log = logging::get_logger();
    auto previous = log->level();

    EXPECT_TRUE(logging::set_level("trace"));
    EXPECT_EQ(log->level(), spdlog::level::trace);
    EXPECT_FALSE(logging::set_level("loud"));
    EXPECT_EQ(log->level(), spdlog::level::trace);

    log->set_level(previous);
}
