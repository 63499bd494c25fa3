// ZKRANGE - Util Module Tests
// Copyright (c) 2024 ZKRANGE Developers
// MIT License

#include <gtest/gtest.h>

#include "zkrange/util/logging.h"
#include "zkrange/util/time.h"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace zkrange {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        previousLevel_ = Logger::Instance().GetLevel();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(previousLevel_);
    }

    std::shared_ptr<CallbackSink> Capture(std::vector<LogEntry>& entries,
                                          LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [&entries](const LogEntry& entry) { entries.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }

    LogLevel previousLevel_{LogLevel::Info};
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Info"), LogLevel::Info);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("error"), LogLevel::Error);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info);
}

TEST_F(LoggingTest, SingletonInstance) {
    Logger& a = Logger::Instance();
    Logger& b = Logger::Instance();
    EXPECT_EQ(&a, &b);
}

TEST_F(LoggingTest, AddRemoveSinks) {
    Logger& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<CallbackSink>([](const LogEntry&) {});
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Warn);

    EXPECT_FALSE(logger.WillLog(LogLevel::Info, LogCategory::VERIFY));
    EXPECT_TRUE(logger.WillLog(LogLevel::Warn, LogCategory::VERIFY));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::VERIFY));
    EXPECT_FALSE(logger.WillLog(LogLevel::Off, LogCategory::VERIFY));

    std::vector<LogEntry> entries;
    Capture(entries);
    LOG_INFO(LogCategory::VERIFY) << "dropped";
    LOG_WARN(LogCategory::VERIFY) << "kept";
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "kept");
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Info);

    logger.EnableCategory(LogCategory::LEDGER);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::LEDGER));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::VERIFY));

    logger.DisableCategory(LogCategory::LEDGER);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::VERIFY));
    EXPECT_TRUE(logger.IsCategoryEnabled("anything"));
}

TEST_F(LoggingTest, CallbackSinkReceivesEntry) {
    Logger::Instance().SetLevel(LogLevel::Info);
    std::vector<LogEntry> entries;
    Capture(entries);

    LOG_INFO(LogCategory::VERIFY) << "accepted proof for " << "alice";

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].category, LogCategory::VERIFY);
    EXPECT_EQ(entries[0].message, "accepted proof for alice");
    EXPECT_GT(entries[0].line, 0);
    EXPECT_EQ(GetBasename(entries[0].file), "test_util.cpp");
}

TEST_F(LoggingTest, CallbackSinkHonoursOwnLevel) {
    Logger::Instance().SetLevel(LogLevel::Trace);
    std::vector<LogEntry> entries;
    Capture(entries, LogLevel::Error);

    LOG_WARN(LogCategory::LEDGER) << "below sink level";
    LOG_ERROR(LogCategory::LEDGER) << "store failure";

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "store failure");
}

TEST_F(LoggingTest, ScopedTimerLogsCompletion) {
    Logger::Instance().SetLevel(LogLevel::Debug);
    std::vector<LogEntry> entries;
    Capture(entries);

    {
        ScopedLogTimer timer(LogCategory::PROOF, "checks");
    }

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Debug);
    EXPECT_NE(entries[0].message.find("Completed: checks in "), std::string::npos);
}

TEST_F(LoggingTest, ScopedTimerSilentAboveDebug) {
    Logger::Instance().SetLevel(LogLevel::Info);
    std::vector<LogEntry> entries;
    Capture(entries);

    {
        ScopedLogTimer timer(LogCategory::PROOF, "checks");
    }
    EXPECT_TRUE(entries.empty());
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    std::random_device rd;
    std::filesystem::path path = std::filesystem::temp_directory_path() /
        ("zkrange_log_test_" + std::to_string(rd()) + ".log");

    Logger::Instance().SetLevel(LogLevel::Info);
    {
        FileSink::Config config;
        config.path = path.string();
        config.append = false;
        auto sink = std::make_shared<FileSink>(config);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);

        LOG_INFO(LogCategory::LEDGER) << "recorded identity";
        Logger::Instance().Flush();
        Logger::Instance().ClearSinks();
    }

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    std::string text = contents.str();

    EXPECT_NE(text.find("[INFO]"), std::string::npos);
    EXPECT_NE(text.find("[ledger]"), std::string::npos);
    EXPECT_NE(text.find("recorded identity"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_F(LoggingTest, FileSinkUnopenablePath) {
    FileSink::Config config;
    config.path = "/nonexistent-dir/zkrange/debug.log";
    FileSink sink(config);
    EXPECT_FALSE(sink.IsOpen());
}

TEST_F(LoggingTest, SetupLoggingReplacesSinks) {
    Logger::Instance().AddSink(std::make_shared<CallbackSink>([](const LogEntry&) {}));
    SetupLogging("error", false);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    EXPECT_EQ(Logger::Instance().GetLevel(), LogLevel::Error);
}

TEST_F(LoggingTest, GetBasename) {
    EXPECT_EQ(GetBasename("/a/b/verifier.cpp"), "verifier.cpp");
    EXPECT_EQ(GetBasename("c:\\src\\ledger.cpp"), "ledger.cpp");
    EXPECT_EQ(GetBasename("plain.cpp"), "plain.cpp");
}

TEST_F(LoggingTest, FormatLogTimestamp) {
    std::string ts = FormatLogTimestamp(std::chrono::system_clock::now());
    // YYYY-MM-DD HH:MM:SS.mmm
    ASSERT_EQ(ts.size(), 23u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[19], '.');
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, RealTimeIsPlausible) {
    EXPECT_GT(GetTime(), 1704067200);
    int64_t millis = GetTimeMillis();
    EXPECT_GE(millis / 1000, GetTime() - 1);
}

TEST_F(TimeTest, MockTime) {
    SetMockTime(1704067200);
    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1704067200);
    EXPECT_EQ(GetTimeMillis(), int64_t(1704067200) * 1000);

    AdvanceMockTime(Seconds(60));
    EXPECT_EQ(GetTime(), 1704067260);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_NE(GetTime(), 1704067260);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(1704067200), "2024-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
}

} // namespace
} // namespace util
} // namespace zkrange
