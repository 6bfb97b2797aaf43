#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <thread>
#include <vector>

#include "test_utils.hpp"
#include "util/Logger.hpp"

using namespace gitminer;
using namespace gitminer::test::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved = Logger::instance().level(); }
    void TearDown() override { Logger::instance().setLevel(saved); }

    LogLevel saved{LogLevel::Info};
};

// Test: Level names and digits
TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(Logger::parseLevel("3", LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(Logger::parseLevel("warn", LogLevel::Info), LogLevel::Warn);
    EXPECT_EQ(Logger::parseLevel("0", LogLevel::Info), LogLevel::Error);
    EXPECT_EQ(Logger::parseLevel("verbose", LogLevel::Warn), LogLevel::Warn);
}

// Test: Messages above the level are dropped, streams and prefixes
TEST_F(LoggerTest, FiltersByLevel) {
    ConsoleCapture capture;
    Logger::instance().setLevel(LogLevel::Warn);
    Logger::instance().debug("hidden debug");
    Logger::instance().info("hidden info");
    Logger::instance().warn("shown warn");
    Logger::instance().error("shown error");

    EXPECT_EQ(capture.out(), "");
    EXPECT_NE(capture.err().find("[warn ] shown warn"), std::string::npos);
    EXPECT_NE(capture.err().find("[error] shown error"), std::string::npos);
}

TEST_F(LoggerTest, DebugGoesToStdout) {
    ConsoleCapture capture;
    Logger::instance().setLevel(LogLevel::Debug);
    Logger::instance().debug("details");
    EXPECT_EQ(capture.out(), "[debug] details\n");
}

// Test: Warnings from several threads while the level is being set
TEST_F(LoggerTest, ConcurrentWarnings) {
    ConsoleCapture capture;
    Logger::instance().setLevel(LogLevel::Warn);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([t] {
            for (int i = 0; i < 50; ++i) {
                Logger::instance().warn("worker " + std::to_string(t));
            }
        });
    }
    for (int i = 0; i < 100; ++i) {
        Logger::instance().setLevel(LogLevel::Warn);
    }
    for (auto& w : workers) w.join();

    std::string err = capture.err();
    size_t lines = 0;
    size_t pos = 0;
    while ((pos = err.find("[warn ] worker ", pos)) != std::string::npos) {
        ++lines;
        pos += 1;
    }
    EXPECT_EQ(lines, 200u);
    EXPECT_EQ(static_cast<size_t>(std::count(err.begin(), err.end(), '\n')), 200u);
}
