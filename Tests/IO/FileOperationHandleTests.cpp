#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "IO/FileOperationHandle.h"
#include "Concurrency/WorkContractGroup.h"

using namespace Scribe::Core::IO;
using Scribe::Core::Concurrency::WorkContractGroup;

TEST(FileOperationHandle, ContinuationIsNeverRunInline) {
    WorkContractGroup group(16, "HandleTest");
    OperationCompleter completer(&group);
    auto h = completer.handle();

    int ran = 0;
    h.then([&ran](const FileOperationHandle&) { ++ran; });
    completer.complete();

    EXPECT_TRUE(h.isComplete());
    EXPECT_EQ(ran, 0);
    group.executeAllMainThreadWork();
    EXPECT_EQ(ran, 1);
}

TEST(FileOperationHandle, ThenAfterCompletionIsStillPosted) {
    WorkContractGroup group(16, "HandleTest");
    OperationCompleter completer(&group);
    completer.completeWithWrite(42);
    auto h = completer.handle();

    uint64_t seen = 0;
    h.then([&seen](const FileOperationHandle& r) { seen = r.bytesWritten(); });
    EXPECT_EQ(seen, 0u);
    group.executeAllMainThreadWork();
    EXPECT_EQ(seen, 42u);
}

TEST(FileOperationHandle, ContinuationsRunInAttachmentOrder) {
    WorkContractGroup group(16, "HandleTest");
    OperationCompleter completer(&group);
    auto h = completer.handle();

    std::vector<int> order;
    h.then([&order](const FileOperationHandle&) { order.push_back(1); });
    h.then([&order](const FileOperationHandle&) { order.push_back(2); });
    completer.complete();
    group.executeAllMainThreadWork();

    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(FileOperationHandle, CompletesOnlyOnce) {
    WorkContractGroup group(16, "HandleTest");
    OperationCompleter completer(&group);
    completer.fail(FileErrorInfo{FileError::DiskFull, "full", std::nullopt, "/x"});
    completer.completeWithWrite(7);

    auto h = completer.handle();
    EXPECT_EQ(h.status(), FileOpStatus::Failed);
    EXPECT_EQ(h.errorInfo().code, FileError::DiskFull);
    EXPECT_EQ(h.bytesWritten(), 0u);
}

TEST(FileOperationHandle, WaitPumpsTheGroup) {
    WorkContractGroup group(16, "HandleTest");
    OperationCompleter completer(&group);
    group.post([completer]() mutable { completer.completeWithBytes({std::byte{'h'}, std::byte{'i'}}); });

    auto h = completer.handle();
    EXPECT_EQ(h.status(), FileOpStatus::Pending);
    h.wait();
    EXPECT_EQ(h.status(), FileOpStatus::Complete);
    EXPECT_EQ(h.contentsText(), "hi");
}

TEST(FileOperationHandle, WaitReturnsWhenNothingCanCompleteIt) {
    WorkContractGroup group(16, "HandleTest");
    OperationCompleter completer(&group);
    auto h = completer.handle();
    h.wait();
    EXPECT_FALSE(h.isComplete());
}

TEST(FileOperationHandle, TryStartOperationConvertsThrows) {
    FileOperationHandle out;
    auto typed = tryStartOperation([]() -> FileOperationHandle {
        throw FileOperationException(FileErrorInfo{FileError::InvalidPath, "bad", std::nullopt, "p"});
    }, out, "p");
    ASSERT_TRUE(typed.has_value());
    EXPECT_EQ(typed->code, FileError::InvalidPath);

    auto generic = tryStartOperation([]() -> FileOperationHandle {
        throw std::runtime_error("boom");
    }, out, "q");
    ASSERT_TRUE(generic.has_value());
    EXPECT_EQ(generic->code, FileError::SetupFailure);
    EXPECT_EQ(generic->path, "q");
    EXPECT_EQ(generic->message, "boom");
}

TEST(FileOperationHandle, ErrorToString) {
    EXPECT_STREQ(fileErrorToString(FileError::FileNotFound), "FileNotFound");
    FileErrorInfo info{FileError::AccessDenied, "denied", std::nullopt, "/a"};
    auto s = info.toString();
    EXPECT_NE(s.find("AccessDenied"), std::string::npos);
    EXPECT_NE(s.find("/a"), std::string::npos);
}
