// File: tests/unit/test_support_logger.cpp
// Purpose: Check logger level filtering and line format.
// Key invariants: Messages below the minimum level are dropped; each line
//                 carries the level tag and component name.
// Ownership/Lifetime: Loggers write into local string streams.

#include <gtest/gtest.h>

#include "support/logger.hpp"

#include <sstream>
#include <string>

using namespace thymus::support;

TEST(Logger, ParsesLevelNames)
{
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("none"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(Logger, FiltersBelowMinimumLevel)
{
    std::ostringstream sink;
    Logger log(sink, LogLevel::Info);
    log.debug("scan", "hidden");
    log.info("scan", "visible");
    log.error("loader", "broken");

    const std::string text = sink.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[INFO] "), std::string::npos);
    EXPECT_NE(text.find(" scan: visible\n"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] "), std::string::npos);
    EXPECT_NE(text.find(" loader: broken\n"), std::string::npos);
}

TEST(Logger, OffSilencesEverything)
{
    std::ostringstream sink;
    Logger log(sink, LogLevel::Off);
    log.error("x", "y");
    EXPECT_TRUE(sink.str().empty());
    EXPECT_FALSE(Logger::null().enabled(LogLevel::Error));
}
