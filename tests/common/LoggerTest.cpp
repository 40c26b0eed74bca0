#include "common/LogLevelParser.h"
#include "common/Logger.h"
#include "mocks/CapturingLoggerBackend.h"
#include <gtest/gtest.h>

using namespace WFE;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        records_ = std::make_shared<Test::CapturingLoggerBackend::Records>();
        Logger::setBackend(std::make_unique<Test::CapturingLoggerBackend>(records_));
    }

    void TearDown() override {
        Logger::setBackend(nullptr);
    }

    std::shared_ptr<Test::CapturingLoggerBackend::Records> records_;
};

TEST_F(LoggerTest, MacrosFormatAndPrefixFunctionName) {
    LOG_INFO("workflow '{}' has {} states", "Article", 5);

    ASSERT_EQ(records_->size(), 1u);
    EXPECT_EQ(records_->front().level, LogLevel::Info);
    EXPECT_NE(records_->front().message.find("LoggerTest_MacrosFormatAndPrefixFunctionName_Test::TestBody() - "),
              std::string::npos);
    EXPECT_NE(records_->front().message.find("workflow 'Article' has 5 states"), std::string::npos);
}

TEST_F(LoggerTest, LevelIsForwardedToBackend) {
    Logger::setLevel(LogLevel::Warn);

    LOG_DEBUG("dropped");
    LOG_INFO("dropped");
    LOG_WARN("kept warning");
    LOG_ERROR("kept error");

    ASSERT_EQ(records_->size(), 2u);
    EXPECT_EQ((*records_)[0].level, LogLevel::Warn);
    EXPECT_EQ((*records_)[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, InitializeKeepsInjectedBackend) {
    Logger::initialize();
    LOG_ERROR("still captured");

    EXPECT_EQ(records_->size(), 1u);
}

TEST(LogLevelParserTest, RecognizesSpdlogNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("err"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("Critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}
