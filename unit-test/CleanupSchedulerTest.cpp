#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "gtest/gtest.h"
#include "workspace/cleanup_scheduler.hpp"

using namespace std;
using namespace runbox;

TEST(CleanupSchedulerTest, RunsTaskAfterDelay) {
    cleanup_scheduler scheduler;
    atomic<int> runs{0};
    scheduler.schedule("delayed", chrono::milliseconds(50), [&] { ++runs; });
    EXPECT_EQ(runs, 0);
    EXPECT_EQ(scheduler.pending(), 1);

    auto deadline = chrono::steady_clock::now() + chrono::seconds(2);
    while (runs == 0 && chrono::steady_clock::now() < deadline)
        this_thread::sleep_for(chrono::milliseconds(10));
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(scheduler.pending(), 0);
}

TEST(CleanupSchedulerTest, CancelledTaskNeverRuns) {
    atomic<int> runs{0};
    {
        cleanup_scheduler scheduler;
        auto token = scheduler.schedule("cancelled", chrono::milliseconds(100), [&] { ++runs; });
        EXPECT_TRUE(scheduler.cancel(token));
        EXPECT_FALSE(scheduler.cancel(token));
        EXPECT_EQ(scheduler.pending(), 0);
    }
    EXPECT_EQ(runs, 0);
}

TEST(CleanupSchedulerTest, FlushRunsPendingTasksNow) {
    cleanup_scheduler scheduler;
    atomic<int> runs{0};
    scheduler.schedule("a", chrono::hours(1), [&] { ++runs; });
    scheduler.schedule("b", chrono::hours(1), [&] { ++runs; });
    scheduler.flush();
    EXPECT_EQ(runs, 2);
    EXPECT_EQ(scheduler.pending(), 0);
}

TEST(CleanupSchedulerTest, DestructorFlushesPendingTasks) {
    atomic<int> runs{0};
    {
        cleanup_scheduler scheduler;
        scheduler.schedule("late", chrono::hours(1), [&] { ++runs; });
    }
    EXPECT_EQ(runs, 1);
}

TEST(CleanupSchedulerTest, FailingTaskDoesNotStopOthers) {
    cleanup_scheduler scheduler;
    atomic<int> runs{0};
    scheduler.schedule("failing", chrono::milliseconds(0), [] { throw runtime_error("disk on fire"); });
    scheduler.schedule("after", chrono::milliseconds(0), [&] { ++runs; });
    EXPECT_NO_THROW(scheduler.flush());
    EXPECT_EQ(runs, 1);
}
