#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "ScribeTestHelpers.h"

using namespace Scribe::Core::IO;
using namespace Scribe::Core::Diagnostics;
using scribe::test_helpers::CompletionRecorder;
using scribe::test_helpers::FaultInjectingBackend;
using scribe::test_helpers::ScopedTempDir;
using scribe::test_helpers::ScopedWorkEnv;

namespace {

// Consumer that records every call, including the sentinel
class RecordingConsumer : public ILineConsumer {
public:
    void process(std::optional<std::string_view> line) override {
        if (line) {
            lines.emplace_back(*line);
        } else {
            ++sentinels;
        }
    }

    std::vector<std::string> lines;
    int sentinels = 0;
};

class ThrowingConsumer : public ILineConsumer {
public:
    void process(std::optional<std::string_view> line) override {
        if (line && *line == "boom") throw std::runtime_error("consumer rejected line");
        ++calls;
    }
    int calls = 0;
};

} // namespace

TEST(StreamingFileReader, DeliversNonEmptyLinesThenSentinel) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("lines.txt");
    scribe::test_helpers::writeAllBytes(path, "x\n\ny\n");

    auto consumer = std::make_shared<RecordingConsumer>();
    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(path.string()), consumer, done.callback());
    env.drain();

    EXPECT_EQ(consumer->lines, (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(consumer->sentinels, 1);
    EXPECT_EQ(done.calls(), 1);
    EXPECT_FALSE(done.error().has_value());
}

TEST(StreamingFileReader, CompletionIsNeverInline) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("lines.txt");
    scribe::test_helpers::writeAllBytes(path, "only\n");

    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(path.string()),
                              [](std::optional<std::string_view>) {}, done.callback());
    EXPECT_EQ(done.calls(), 0);
    env.drain();
    EXPECT_EQ(done.calls(), 1);
}

TEST(StreamingFileReader, YieldsBetweenLines) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("many.txt");
    scribe::test_helpers::writeAllBytes(path, "1\n2\n3\n4\n");

    std::vector<std::string> seen;
    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(path.string()),
                              [&seen](std::optional<std::string_view> line) {
                                  if (line) seen.emplace_back(*line);
                              },
                              done.callback());

    // Run until the first line arrives, then other work must be able to interleave
    while (seen.empty() && env.group().executeMainThreadWork(1) > 0) {}
    ASSERT_EQ(seen.size(), 1u);

    bool otherRan = false;
    env.group().post([&] { otherRan = true; });
    env.group().executeMainThreadWork(2);
    EXPECT_TRUE(otherRan);
    EXPECT_LT(seen.size(), 4u);

    env.drain();
    EXPECT_EQ(seen, (std::vector<std::string>{"1", "2", "3", "4"}));
    EXPECT_TRUE(done.succeeded());
}

TEST(StreamingFileReader, MissingFile_ReportsFileNotFound_NoProcessCalls) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;

    auto consumer = std::make_shared<RecordingConsumer>();
    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(tmp.join("missing.txt").string()),
                              consumer, done.callback());
    env.drain();

    EXPECT_TRUE(consumer->lines.empty());
    EXPECT_EQ(consumer->sentinels, 0);
    ASSERT_EQ(done.calls(), 1);
    ASSERT_TRUE(done.error().has_value());
    EXPECT_EQ(done.error()->code, FileError::FileNotFound);
}

TEST(StreamingFileReader, ConsumerException_IsReportedOnce) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("boom.txt");
    scribe::test_helpers::writeAllBytes(path, "ok\nboom\nnever\n");

    auto consumer = std::make_shared<ThrowingConsumer>();
    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(path.string()), consumer, done.callback());
    env.drain();

    EXPECT_EQ(consumer->calls, 1);
    ASSERT_EQ(done.calls(), 1);
    ASSERT_TRUE(done.error().has_value());
    EXPECT_EQ(done.error()->code, FileError::Unknown);
    EXPECT_EQ(done.error()->message, "consumer rejected line");
}

TEST(StreamingFileReader, NonStandardConsumerException_IsReportedOnce) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("int.txt");
    scribe::test_helpers::writeAllBytes(path, "a\nb\n");

    int seen = 0;
    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(path.string()),
                              [&seen](std::optional<std::string_view> line) {
                                  ++seen;
                                  if (line && *line == "a") throw 42;
                              }, done.callback());
    EXPECT_NO_THROW(env.drain());

    EXPECT_EQ(seen, 1);
    ASSERT_EQ(done.calls(), 1);
    ASSERT_TRUE(done.error().has_value());
    EXPECT_EQ(done.error()->code, FileError::Unknown);
    EXPECT_EQ(done.error()->message, "non-standard exception");
}

TEST(StreamingFileReader, InvalidUtf8_IsDecodedLossily) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("bad.txt");
    scribe::test_helpers::writeAllBytes(path, std::string("ok\n\xFF\n", 5));

    auto consumer = std::make_shared<RecordingConsumer>();
    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(path.string()), consumer, done.callback());
    env.drain();

    EXPECT_EQ(consumer->lines, (std::vector<std::string>{"ok", "\xEF\xBF\xBD"}));
    EXPECT_TRUE(done.succeeded());
}

TEST(StreamingFileReader, SpanHooks_StartEndDoneOnSuccess) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("span.txt");
    scribe::test_helpers::writeAllBytes(path, "a\n");

    auto timeline = std::make_shared<TimeLine>();
    env.access().setSpanObserver(timeline);

    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(path.string()),
                              [](std::optional<std::string_view>) {}, done.callback(), "read-span");
    env.drain();

    auto records = timeline->records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].event, SpanEvent::Start);
    EXPECT_EQ(records[1].event, SpanEvent::End);
    EXPECT_EQ(records[2].event, SpanEvent::Done);
    EXPECT_EQ(records[0].id, "read-span");
    EXPECT_TRUE(done.succeeded());
}

TEST(StreamingFileReader, SpanHooks_NoEndOnFailure) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;

    auto timeline = std::make_shared<TimeLine>();
    env.access().setSpanObserver(timeline);

    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(tmp.join("nope.txt").string()),
                              [](std::optional<std::string_view>) {}, done.callback(), "missing-span");
    env.drain();

    auto stats = timeline->stats("missing-span");
    EXPECT_EQ(stats.starts, 1u);
    EXPECT_EQ(stats.ends, 0u);
    EXPECT_EQ(stats.dones, 1u);
    EXPECT_EQ(done.calls(), 1);
}

TEST(StreamingFileReader, NoSpanId_NoHooks) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    auto path = tmp.join("quiet.txt");
    scribe::test_helpers::writeAllBytes(path, "a\n");

    auto timeline = std::make_shared<TimeLine>();
    env.access().setSpanObserver(timeline);

    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle(path.string()),
                              [](std::optional<std::string_view>) {}, done.callback());
    env.drain();

    EXPECT_TRUE(timeline->records().empty());
    EXPECT_TRUE(done.succeeded());
}

TEST(StreamingFileReader, SynchronousSetupFailure_IsDeliveredThroughCallback) {
    std::shared_ptr<FaultInjectingBackend> fault;
    ScopedWorkEnv env([&fault](Scribe::Core::Concurrency::WorkContractGroup* g) {
        fault = std::make_shared<FaultInjectingBackend>(std::make_shared<LocalFileSystemBackend>(g), g);
        return fault;
    });
    fault->faults().throwOnRead = true;

    CompletionRecorder done;
    env.access().readFromFile(env.access().createFileHandle("/irrelevant.txt"),
                              [](std::optional<std::string_view>) {}, done.callback());
    env.drain();

    ASSERT_EQ(done.calls(), 1);
    ASSERT_TRUE(done.error().has_value());
    EXPECT_EQ(done.error()->code, FileError::SetupFailure);
}
