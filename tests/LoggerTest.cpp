#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "TestData.hpp"
#include "monitor/Logger.hpp"

TEST(LoggerTest, WritesTaggedLines) {
    std::ostringstream out;
    Logger log(out, LogLevel::Info);
    log.info("Optimizer", "ready");
    log.warn("ModelFactory", "fallback");

    std::string text = out.str();
    EXPECT_NE(text.find("[INFO][Optimizer] ready"), std::string::npos);
    EXPECT_NE(text.find("[WARN][ModelFactory] fallback"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowLevel) {
    std::ostringstream out;
    Logger log(out, LogLevel::Warn);
    log.debug("T", "debug line");
    log.info("T", "info line");
    log.error("T", "error line");

    std::string text = out.str();
    EXPECT_EQ(text.find("debug line"), std::string::npos);
    EXPECT_EQ(text.find("info line"), std::string::npos);
    EXPECT_NE(text.find("[ERROR][T] error line"), std::string::npos);
}

TEST(LoggerTest, OffWritesNothing) {
    std::ostringstream out;
    Logger log(out, LogLevel::Off);
    log.error("T", "dropped");
    EXPECT_TRUE(out.str().empty());
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("none"), LogLevel::Off);
    EXPECT_EQ(parseLogLevel("bogus"), LogLevel::Info);
}

TEST(LoggerTest, TraceRowsGoToCsv) {
    std::string path = testdata::tempPath("logger_trace.csv");
    std::remove(path.c_str());

    {
        std::ostringstream out;
        Logger log(out, LogLevel::Off, path);
        ASSERT_TRUE(log.tracing());

        LogEntry e{"2026-01-01T00:00:00", 3, 6, 5, 0.75, 12.5, 2};
        log.log(e);
    }

    std::ifstream in(path);
    std::string header, row;
    std::getline(in, header);
    std::getline(in, row);

    EXPECT_EQ(header, "timestamp,component_count,record_count,token_count,confidence,duration_ms,warnings");
    EXPECT_EQ(row, "2026-01-01T00:00:00,3,6,5,0.75,12.5,2");
}
