#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

#include "test_utils.hpp"
#include "core/LogSource.hpp"

namespace fs = std::filesystem;

using namespace gitminer;
using namespace gitminer::test::utils;

class LogSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
};

// Test: Plain text file is returned byte for byte
TEST_F(LogSourceTest, ReadsPlainFile) {
    fs::path p = createFile(tempDir, "history.log", sampleLog());
    auto text = LogSource::readLogText(p);
    ASSERT_TRUE(text.has_value()) << text.error().message;
    EXPECT_EQ(text.value(), sampleLog());
}

// Test: Gzip file is inflated, whatever its name
TEST_F(LogSourceTest, ReadsGzipFile) {
    fs::path p = createGzipFile(tempDir, "history.dat", sampleLog());
    ASSERT_TRUE(LogSource::isGzip(readFile(p)));
    auto text = LogSource::readLogText(p);
    ASSERT_TRUE(text.has_value()) << text.error().message;
    EXPECT_EQ(text.value(), sampleLog());
}

// Test: Concatenated gzip members inflate back to back
TEST_F(LogSourceTest, ConcatenatedGzipMembers) {
    std::string bytes = gzipCompress("first\n") + gzipCompress("second\n");
    auto text = LogSource::decode(bytes);
    ASSERT_TRUE(text.has_value()) << text.error().message;
    EXPECT_EQ(text.value(), "first\nsecond\n");
}

// Test: Truncated gzip is an IoError
TEST_F(LogSourceTest, TruncatedGzip) {
    std::string bytes = gzipCompress(sampleLog());
    bytes.resize(bytes.size() / 2);
    auto text = LogSource::decode(bytes);
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, ErrorCode::IoError);
}

TEST_F(LogSourceTest, MissingFile) {
    auto text = LogSource::readLogText(tempDir / "nope.log");
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, ErrorCode::IoError);
    EXPECT_NE(text.error().message.find("nope.log"), std::string::npos);
}

TEST_F(LogSourceTest, DirectoryIsRejected) {
    auto text = LogSource::readLogText(tempDir);
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, ErrorCode::IoError);
}

// Test: Streams are decoded the same way as files
TEST_F(LogSourceTest, ReadsStream) {
    std::istringstream plain(sampleLog());
    auto text = LogSource::readLogText(plain);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(text.value(), sampleLog());

    std::istringstream zipped(gzipCompress(sampleLog()));
    text = LogSource::readLogText(zipped);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(text.value(), sampleLog());
}

TEST_F(LogSourceTest, EmptyInput) {
    EXPECT_FALSE(LogSource::isGzip(""));
    auto text = LogSource::decode("");
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(text.value(), "");
}
