#include <gtest/gtest.h>
#include "matchgraph/common/Logger.h"
#include "matchgraph/backends/DefaultBackend.h"
#ifdef MATCHGRAPH_USE_SPDLOG
#include "matchgraph/backends/SpdlogBackend.h"
#endif

using namespace matchgraph;

// ============================================================================
// LoggerTest - 로그 캡처 API 테스트
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::clearCapturedLogs();
        Logger::enableCapture(true);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
    }
};

TEST_F(LoggerTest, Capture_RecordsLevelAndFunction) {
    LOG_WARN("edge {} skipped", "a__b");

    auto lines = Logger::getCapturedLogs();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].rfind("[warn] ", 0), 0u);
    EXPECT_NE(lines[0].find("edge a__b skipped"), std::string::npos);
    EXPECT_NE(lines[0].find("TestBody"), std::string::npos);
}

TEST_F(LoggerTest, Capture_PatternFilter) {
    LOG_INFO("loaded {} teams", 3);
    LOG_DEBUG("{} crossings", 2);
    LOG_ERROR("cannot open {}", "x.json");

    EXPECT_EQ(Logger::getCapturedLogs("crossings").size(), 1u);
    EXPECT_EQ(Logger::getCapturedLogs("[error]").size(), 1u);
    EXPECT_TRUE(Logger::getCapturedLogs("nothing").empty());
}

TEST_F(LoggerTest, Capture_MaxLinesKeepsMostRecent) {
    for (int i = 0; i < 5; ++i) {
        LOG_INFO("line {}", i);
    }

    auto lines = Logger::getCapturedLogs("line", 2);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("line 3"), std::string::npos);
    EXPECT_NE(lines[1].find("line 4"), std::string::npos);
}

TEST_F(LoggerTest, Capture_DisabledRecordsNothing) {
    Logger::enableCapture(false);
    EXPECT_FALSE(Logger::isCaptureEnabled());

    LOG_INFO("not captured");

    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST_F(LoggerTest, Capture_ClearDropsLines) {
    LOG_INFO("first");
    Logger::clearCapturedLogs();

    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST_F(LoggerTest, Capture_IgnoresLevelThreshold) {
    Logger::setLevel(LogLevel::Error);
    LOG_DEBUG("quiet on the console");
    Logger::setLevel(LogLevel::Info);

    EXPECT_EQ(Logger::getCapturedLogs("quiet").size(), 1u);
}

// --- Backends ---

TEST(LoggerBackendTest, DefaultBackend_HonoursLevel) {
    DefaultBackend backend;
    backend.setLevel(LogLevel::Off);

    EXPECT_NO_THROW(backend.log(LogLevel::Error, "suppressed", std::source_location::current()));
    EXPECT_NO_THROW(backend.flush());
}

TEST(LoggerBackendTest, DefaultBackend_WritesToStderr) {
    DefaultBackend backend;
    backend.setLevel(LogLevel::Info);

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    backend.log(LogLevel::Warn, "edge a__b skipped", std::source_location::current());
    backend.flush();
    std::string err = ::testing::internal::GetCapturedStderr();
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(err.find("edge a__b skipped"), std::string::npos);
    EXPECT_NE(err.find("warn"), std::string::npos);
    EXPECT_EQ(out.find("edge a__b skipped"), std::string::npos);
}

#ifdef MATCHGRAPH_USE_SPDLOG
TEST(LoggerBackendTest, SpdlogBackend_ConsoleOnlyHasNoLogFile) {
    SpdlogBackend backend;

    EXPECT_TRUE(backend.logFilePath().empty());
    EXPECT_NO_THROW(backend.log(LogLevel::Debug, "console only", std::source_location::current()));
}
#endif
