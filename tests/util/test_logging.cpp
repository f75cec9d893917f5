// ZKGAS - Logging Tests
// Copyright (c) 2025 ZKGAS Developers
// MIT License

#include <gtest/gtest.h>

#include "zkgas/util/logging.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace zkgas {
namespace util {
namespace test {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Trace);

        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); },
            LogLevel::Trace);
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

// ============================================================================
// Level Tests
// ============================================================================

TEST_F(LoggingTest, LevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
}

TEST_F(LoggingTest, ParseLevel) {
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(ParseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("Warning", level));
    EXPECT_EQ(level, LogLevel::Warn);
    EXPECT_TRUE(ParseLogLevel("OFF", level));
    EXPECT_EQ(level, LogLevel::Off);

    EXPECT_FALSE(ParseLogLevel("loud", level));
    EXPECT_EQ(level, LogLevel::Off);
}

// ============================================================================
// Logger Tests
// ============================================================================

TEST_F(LoggingTest, StreamMacroDeliversEntry) {
    LOG_INFO(LogCategory::PAYMASTER) << "group=" << 5 << " ok";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, "paymaster");
    EXPECT_EQ(entries_[0].message, "group=5 ok");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, FormatMacroDeliversEntry) {
    LogWarnF(LogCategory::LEDGER, "balance %lld", static_cast<long long>(-3));

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warn);
    EXPECT_EQ(entries_[0].category, "ledger");
    EXPECT_EQ(entries_[0].message, "balance -3");
}

TEST_F(LoggingTest, LevelFiltersMessages) {
    Logger::Instance().SetLevel(LogLevel::Warn);

    LOG_DEBUG(LogCategory::CACHE) << "hidden";
    LOG_INFO(LogCategory::CACHE) << "hidden";
    LOG_ERROR(LogCategory::CACHE) << "shown";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Info, LogCategory::CACHE));
    EXPECT_TRUE(Logger::Instance().WillLog(LogLevel::Error, LogCategory::CACHE));
}

TEST_F(LoggingTest, SinkLevelFiltersMessages) {
    sink_->SetLevel(LogLevel::Error);

    LOG_WARN(LogCategory::QUOTA) << "below sink level";
    LOG_ERROR(LogCategory::QUOTA) << "at sink level";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "at sink level");
}

TEST_F(LoggingTest, CategoryFilter) {
    Logger::Instance().EnableCategory(LogCategory::POLICY);

    LOG_INFO(LogCategory::POLICY) << "policy";
    LOG_INFO(LogCategory::LEDGER) << "ledger";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "policy");
    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::POLICY));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::LEDGER));

    Logger::Instance().EnableAllCategories();
    LOG_INFO(LogCategory::LEDGER) << "ledger";
    EXPECT_EQ(entries_.size(), 2u);
}

TEST_F(LoggingTest, TimestampFormat) {
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    EXPECT_EQ(FormatLogTimestamp(tp), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(FormatLogTimestamp(std::chrono::system_clock::time_point()),
              "1970-01-01T00:00:00.000Z");
}

TEST_F(LoggingTest, ConsoleSinkLevel) {
    ConsoleSink::Config config;
    config.level = LogLevel::Error;
    auto console = std::make_shared<ConsoleSink>(config);
    EXPECT_EQ(console->GetLevel(), LogLevel::Error);
    console->SetLevel(LogLevel::Warn);
    EXPECT_EQ(console->GetLevel(), LogLevel::Warn);

    Logger::Instance().AddSink(console);
    EXPECT_EQ(Logger::Instance().SinkCount(), 2u);
    LOG_INFO(LogCategory::DEFAULT) << "callback only";
    EXPECT_EQ(entries_.size(), 1u);
}

TEST_F(LoggingTest, RemoveSink) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    Logger::Instance().RemoveSink(sink_);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);

    LOG_ERROR(LogCategory::DEFAULT) << "nobody listening";
    EXPECT_TRUE(entries_.empty());
}

} // namespace test
} // namespace util
} // namespace zkgas
