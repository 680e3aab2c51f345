#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Concurrency/WorkContractGroup.h"

using namespace Scribe::Core::Concurrency;

TEST(MainThreadWork, ScheduleAndDrain_MainThreadTasks) {
    WorkContractGroup group(128, "MTTest");

    int ran = 0;
    const int N = 7;

    for (int i = 0; i < N; ++i) {
        auto h = group.createContract([&ran]() { ++ran; });
        auto res = h.schedule();
        ASSERT_EQ(res, ScheduleResult::Scheduled);
    }

    // Drain all work in the calling thread
    size_t executed = group.executeAllMainThreadWork();

    EXPECT_EQ(static_cast<int>(executed), N);
    EXPECT_EQ(ran, N);
    EXPECT_EQ(group.scheduledCount(), 0u);
    EXPECT_EQ(group.activeCount(), 0u);
}

TEST(MainThreadWork, RunsInScheduleOrder) {
    WorkContractGroup group(16, "OrderTest");
    std::vector<int> order;

    auto first = group.createContract([&] { order.push_back(1); });
    auto second = group.createContract([&] { order.push_back(2); });
    auto third = group.createContract([&] { order.push_back(3); });
    // Creation order does not matter, schedule order does
    third.schedule();
    first.schedule();
    second.schedule();

    group.executeAllMainThreadWork();
    EXPECT_EQ(order, (std::vector<int>{3, 1, 2}));
}

TEST(MainThreadWork, ExecuteBounded_LeavesRemainderQueued) {
    WorkContractGroup group(16, "BoundedTest");
    int ran = 0;
    for (int i = 0; i < 5; ++i) {
        group.post([&ran] { ++ran; });
    }

    EXPECT_EQ(group.executeMainThreadWork(2), 2u);
    EXPECT_EQ(ran, 2);
    EXPECT_EQ(group.scheduledCount(), 3u);
    EXPECT_TRUE(group.hasScheduledWork());

    group.executeAllMainThreadWork();
    EXPECT_EQ(ran, 5);
    EXPECT_FALSE(group.hasScheduledWork());
}

TEST(MainThreadWork, WorkScheduledWhileDraining_IsAlsoDrained) {
    WorkContractGroup group(4, "ChainTest");
    int depth = 0;
    std::function<void()> step = [&] {
        if (++depth < 10) group.post(step);
    };
    group.post(step);

    group.executeAllMainThreadWork();
    EXPECT_EQ(depth, 10);
    EXPECT_EQ(group.activeCount(), 0u);
}

TEST(MainThreadWork, DebugStringReportsCounters) {
    WorkContractGroup group(8, "DebugGroup");
    auto a = group.createContract([] {});
    group.createContract([] {}).schedule();

    auto text = group.debugString();
    EXPECT_NE(text.find("DebugGroup"), std::string::npos);
    EXPECT_NE(text.find("capacity=8"), std::string::npos);
    EXPECT_NE(text.find("active=2"), std::string::npos);
    EXPECT_NE(text.find("scheduled=1"), std::string::npos);

    a.release();
    group.executeAllMainThreadWork();
    EXPECT_NE(group.debugString().find("active=0 scheduled=0"), std::string::npos);
}
