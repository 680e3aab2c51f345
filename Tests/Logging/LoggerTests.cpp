#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "Logging/Logger.h"
#include "Logging/CLogger.h"

using namespace Scribe::Core::Logging;

namespace {

class CaptureSink : public ILogSink {
public:
    void write(const LogEntry& entry) override { entries.push_back(entry); }
    void flush() override { ++flushes; }

    std::vector<LogEntry> entries;
    int flushes = 0;
};

// Swaps the global logger's sinks and level for the duration of a test
class ScopedGlobalCapture {
public:
    ScopedGlobalCapture() : sink(std::make_shared<CaptureSink>()), _previous(Logger::global().minLevel()) {
        Logger::global().addSink(sink);
        Logger::global().setMinLevel(LogLevel::Trace);
    }
    ~ScopedGlobalCapture() {
        Logger::global().removeSink(sink);
        Logger::global().setMinLevel(_previous);
    }

    std::shared_ptr<CaptureSink> sink;

private:
    LogLevel _previous;
};

} // namespace

TEST(Logger, FiltersBelowMinimumLevel) {
    Logger logger;
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);
    logger.setMinLevel(LogLevel::Warning);

    logger.log(LogLevel::Info, "Test", "dropped");
    logger.log(LogLevel::Error, "Test", "kept");

    ASSERT_EQ(sink->entries.size(), 1u);
    EXPECT_EQ(sink->entries[0].message, "kept");
    EXPECT_EQ(sink->entries[0].category, "Test");
    EXPECT_EQ(sink->entries[0].level, LogLevel::Error);
}

TEST(Logger, OffDisablesEverything) {
    Logger logger;
    auto sink = std::make_shared<CaptureSink>();
    logger.addSink(sink);
    logger.setMinLevel(LogLevel::Off);
    logger.log(LogLevel::Fatal, "Test", "silenced");
    EXPECT_TRUE(sink->entries.empty());
    EXPECT_FALSE(logger.isEnabled(LogLevel::Fatal));
}

TEST(Logger, SinkManagement) {
    Logger logger;
    auto a = std::make_shared<CaptureSink>();
    auto b = std::make_shared<CaptureSink>();
    logger.addSink(a);
    logger.addSink(b);
    EXPECT_EQ(logger.sinkCount(), 2u);

    logger.removeSink(a);
    logger.log(LogLevel::Error, "Test", "only b");
    EXPECT_TRUE(a->entries.empty());
    EXPECT_EQ(b->entries.size(), 1u);

    logger.flush();
    EXPECT_EQ(b->flushes, 1);

    logger.clearSinks();
    EXPECT_EQ(logger.sinkCount(), 0u);
}

TEST(Logger, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
    EXPECT_STREQ(logLevelToString(LogLevel::Error), "ERROR");
}

TEST(Logger, MacrosRouteThroughGlobalLogger) {
    ScopedGlobalCapture capture;
    SCRIBE_LOG_INFO_CAT("FileAccess", std::string("hello ") + "world");

    ASSERT_EQ(capture.sink->entries.size(), 1u);
    EXPECT_EQ(capture.sink->entries[0].category, "FileAccess");
    EXPECT_EQ(capture.sink->entries[0].message, "hello world");
}

TEST(Logger, CShimFormatsPrintfStyle) {
    ScopedGlobalCapture capture;
    SCRIBE_LOG_WARNING_CAT_F("Shim", "%d lines from %s", 3, "notes.txt");

    ASSERT_EQ(capture.sink->entries.size(), 1u);
    EXPECT_EQ(capture.sink->entries[0].level, LogLevel::Warning);
    EXPECT_EQ(capture.sink->entries[0].category, "Shim");
    EXPECT_EQ(capture.sink->entries[0].message, "3 lines from notes.txt");
}
