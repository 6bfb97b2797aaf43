#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "test_utils.hpp"
#include "cli/commands/RevisionsCommand.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

using namespace gitminer;
using namespace gitminer::test::utils;

class RevisionsCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        savedLevel = Logger::instance().level();
        Logger::instance().setLevel(LogLevel::Error);
        logPath = createFile(tempDir, "history.log", sampleLog());
    }

    void TearDown() override {
        Logger::instance().setLevel(savedLevel);
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path logPath;
    LogLevel savedLevel{LogLevel::Info};
    AppContext ctx;
};

// Test: All files, most revised first
TEST_F(RevisionsCommandTest, RanksFiles) {
    ConsoleCapture capture;
    RevisionsCommand cmd;
    auto result = cmd.execute(ctx, {logPath.string()});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::string out = capture.out();
    size_t main = out.find("        2  src/main.cpp");
    size_t readme = out.find("        1  README.md");
    size_t logo = out.find("        1  assets/logo.png");
    ASSERT_NE(main, std::string::npos) << out;
    ASSERT_NE(readme, std::string::npos) << out;
    ASSERT_NE(logo, std::string::npos) << out;
    EXPECT_LT(main, readme);
    EXPECT_LT(readme, logo);
    EXPECT_EQ(out.find("more files"), std::string::npos);
}

// Test: --top limits the table
TEST_F(RevisionsCommandTest, TopLimit) {
    ConsoleCapture capture;
    RevisionsCommand cmd;
    auto result = cmd.execute(ctx, {"--top", "1", logPath.string()});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::string out = capture.out();
    EXPECT_NE(out.find("src/main.cpp"), std::string::npos);
    EXPECT_EQ(out.find("README.md"), std::string::npos);
    EXPECT_NE(out.find("(2 more files)"), std::string::npos);
}

// Test: --top 0 shows everything
TEST_F(RevisionsCommandTest, TopZeroShowsAll) {
    ConsoleCapture capture;
    RevisionsCommand cmd;
    ASSERT_TRUE(cmd.execute(ctx, {"--top", "0", logPath.string()}).has_value());
    EXPECT_NE(capture.out().find("assets/logo.png"), std::string::npos);
}

TEST_F(RevisionsCommandTest, BadTopValue) {
    RevisionsCommand cmd;
    EXPECT_EQ(cmd.execute(ctx, {"--top", "-1", logPath.string()}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(cmd.execute(ctx, {logPath.string(), "--top"}).error().code, ErrorCode::InvalidArgs);
}
