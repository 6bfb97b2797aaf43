#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "test_utils.hpp"
#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitminer::test {

using namespace gitminer::test::utils;

/**
 * @brief Integration tests running commands the way main() does
 *
 * Commands are looked up by name in the factory and executed through the
 * invoker, so failures are reported through the logger.
 */
class LogWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        registerCommands();
        tempDir = createTempDir();
        savedLevel = Logger::instance().level();
        Logger::instance().setLevel(LogLevel::Warn);
    }

    void TearDown() override {
        Logger::instance().setLevel(savedLevel);
        removeDir(tempDir);
    }

    Expected<void> run(const std::string& name, const std::vector<std::string>& args) {
        auto cmd = CommandFactory::instance().create(name);
        if (!cmd) return Error{ErrorCode::InvalidArgs, "no command " + name, name};
        return invoker.invoke(*cmd, ctx, args);
    }

    fs::path tempDir;
    LogLevel savedLevel{LogLevel::Info};
    CommandInvoker invoker;
    AppContext ctx;
};

/**
 * @brief Test: One gzip export through every command
 * Positive: summary, revisions and entries agree on the same log
 */
TEST_F(LogWorkflowTest, GzipExportThroughAllCommands) {
    fs::path log = createGzipFile(tempDir, "history.log.gz", sampleLog());
    ConsoleCapture capture;

    ASSERT_TRUE(run("summary", {log.string()}).has_value()) << capture.err();
    EXPECT_NE(capture.out().find("Commits:                3"), std::string::npos);
    capture.clear();

    ASSERT_TRUE(run("revisions", {"--top", "1", log.string()}).has_value()) << capture.err();
    EXPECT_NE(capture.out().find("        2  src/main.cpp"), std::string::npos);
    EXPECT_NE(capture.out().find("(2 more files)"), std::string::npos);
    capture.clear();

    ASSERT_TRUE(run("entries", {"-n", "1", log.string()}).has_value()) << capture.err();
    EXPECT_NE(capture.out().find("commit c3d4e5f"), std::string::npos);
    EXPECT_EQ(capture.out().find("commit b2c3d4e"), std::string::npos);
    EXPECT_EQ(capture.err(), "");
}

/**
 * @brief Test: A bad line fails the command with its line number
 * Negative: the invoker logs the error, nothing reaches stdout
 */
TEST_F(LogWorkflowTest, MalformedChangeIsReported) {
    std::string text = blocks({
        lines({header("a1", "2023-01-01", "Alice"), change("1", "2", "ok.txt")}),
        lines({header("b2", "2023-01-02", "Bob"), "1 2 broken.txt"}),
    });
    fs::path log = createFile(tempDir, "broken.log", text);
    ConsoleCapture capture;

    auto result = run("summary", {log.string()});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MalformedChange);
    EXPECT_EQ(capture.out(), "");
    EXPECT_NE(capture.err().find("[error] summary: MalformedChange in"), std::string::npos) << capture.err();
    EXPECT_NE(capture.err().find("line 5: "), std::string::npos) << capture.err();
    EXPECT_EQ(capture.err().find("gitminer help"), std::string::npos);
}

/**
 * @brief Test: Usage errors point at the command's help
 */
TEST_F(LogWorkflowTest, UsageErrorSuggestsHelp) {
    ConsoleCapture capture;
    auto result = run("revisions", {"--top"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
    EXPECT_NE(capture.err().find("see 'gitminer help revisions'"), std::string::npos);
}

/**
 * @brief Test: Headerless changes are dropped with a warning, or rejected with --strict
 */
TEST_F(LogWorkflowTest, OrphanChanges) {
    std::string text = blocks({
        lines({header("a1", "2023-01-01", "Alice"), change("1", "0", "a.txt")}),
        lines({change("3", "3", "orphan.txt")}),
    });
    fs::path log = createFile(tempDir, "orphan.log", text);
    ConsoleCapture capture;

    ASSERT_TRUE(run("summary", {log.string()}).has_value());
    EXPECT_NE(capture.out().find("File changes:           1"), std::string::npos);
    EXPECT_NE(capture.err().find("[warn ] Ignoring 1 file change(s) at line 4"), std::string::npos)
        << capture.err();
    capture.clear();

    auto strict = run("summary", {"--strict", log.string()});
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, ErrorCode::AmbiguousBlock);
    EXPECT_NE(capture.err().find("line 4: "), std::string::npos) << capture.err();
}

/**
 * @brief Test: Missing file surfaces as an I/O error
 */
TEST_F(LogWorkflowTest, MissingFile) {
    ConsoleCapture capture;
    auto result = run("entries", {(tempDir / "nowhere.log").string()});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
    EXPECT_NE(capture.err().find("nowhere.log"), std::string::npos);
}

/**
 * @brief Test: A large export parses identically with several jobs
 */
TEST_F(LogWorkflowTest, ParallelMatchesSequential) {
    std::vector<std::string> bs;
    for (int i = 0; i < 200; ++i) {
        std::string id = "c" + std::to_string(i);
        std::string author = (i % 3 == 0) ? "Alice" : (i % 3 == 1 ? "Bob" : "Carol");
        bs.push_back(lines({header(id, "2023-01-01", author),
                            change(std::to_string(i), "1", "src/file" + std::to_string(i % 17) + ".cpp")}));
    }
    fs::path log = createFile(tempDir, "big.log", blocks(bs) + "\n");
    ConsoleCapture capture;

    ASSERT_TRUE(run("revisions", {"--top", "0", log.string()}).has_value());
    std::string sequential = capture.out();
    capture.clear();
    ASSERT_TRUE(run("revisions", {"--top", "0", "--jobs", "8", log.string()}).has_value());
    EXPECT_EQ(capture.out(), sequential);
    EXPECT_NE(sequential.find("src/file16.cpp"), std::string::npos);
}

}
