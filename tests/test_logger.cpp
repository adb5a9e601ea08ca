#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/logger.hpp"

namespace cursorup {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::Instance().SetLogFile("");
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    testutil::TemporaryDirectory tmp_;
};

TEST_F(LoggerTest, MirrorsRecordsToLogFile) {
    const std::string path = tmp_.Path() + "/updater.log";
    ASSERT_TRUE(Logger::Instance().SetLogFile(path));
    EXPECT_EQ(Logger::Instance().LogFilePath(), path);

    LogInfo("Installed version: %s", "0.42.0");
    LogError("Update aborted: %d", 5);

    const std::string text = testutil::ReadTextFile(path);
    EXPECT_NE(text.find("[INFO]"), std::string::npos);
    EXPECT_NE(text.find("Installed version: 0.42.0\n"), std::string::npos);
    EXPECT_NE(text.find("[ERROR]"), std::string::npos);
    EXPECT_NE(text.find("test_logger.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, RespectsLevelAndAppends) {
    const std::string path = tmp_.Path() + "/updater.log";
    ASSERT_TRUE(testutil::WriteTextFile(path, "previous run\n"));
    ASSERT_TRUE(Logger::Instance().SetLogFile(path));
    Logger::Instance().SetLevel(LogLevel::Warn);

    LogInfo("hidden");
    LogWarn("shown");

    const std::string text = testutil::ReadTextFile(path);
    EXPECT_EQ(text.rfind("previous run\n", 0), 0u);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("shown"), std::string::npos);
}

TEST_F(LoggerTest, UnwritableLogFileIsReported) {
    EXPECT_FALSE(Logger::Instance().SetLogFile(tmp_.Path() + "/missing/dir/updater.log"));
    EXPECT_TRUE(Logger::Instance().LogFilePath().empty());
}

} // namespace
} // namespace cursorup
