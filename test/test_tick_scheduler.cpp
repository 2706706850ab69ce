/*
 * Unit tests for Tick_Scheduler deadline math and emission thread
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include "logic/tick_scheduler.hpp"

// ============================================================================
// Test Suite: TickNextDeadline
// ============================================================================

TEST(TickNextDeadline, OnTimeAdvancesOnePeriod) {
    uint32_t skipped = 99;
    EXPECT_EQ(tick_next_deadline(0, 1500, 100000, &skipped), 100000U);
    EXPECT_EQ(skipped, 0U);
}

TEST(TickNextDeadline, DeadlineExactlyAtNowIsKept) {
    uint32_t skipped = 99;
    EXPECT_EQ(tick_next_deadline(0, 100000, 100000, &skipped), 100000U);
    EXPECT_EQ(skipped, 0U);
}

TEST(TickNextDeadline, OverrunSkipsWholePeriods) {
    uint32_t skipped = 0;
    EXPECT_EQ(tick_next_deadline(0, 250000, 100000, &skipped), 300000U);
    EXPECT_EQ(skipped, 2U);

    EXPECT_EQ(tick_next_deadline(0, 200000, 100000, &skipped), 200000U);
    EXPECT_EQ(skipped, 1U);
}

TEST(TickNextDeadline, StaysOnOriginalGrid) {
    uint32_t skipped = 0;
    uint64_t next = tick_next_deadline(500000, 812345, 100000, &skipped);
    EXPECT_EQ(next, 900000U);
    EXPECT_EQ(skipped, 3U);
    EXPECT_EQ((next - 500000U) % 100000U, 0U);
}

TEST(TickNextDeadline, NullSkippedAllowed) {
    EXPECT_EQ(tick_next_deadline(0, 350000, 100000, nullptr), 400000U);
}

// ============================================================================
// Test Suite: TickScheduler (threaded)
// ============================================================================

TEST(TickScheduler, FiresAtConfiguredPeriod) {
    Tick_Scheduler sched(20);
    std::atomic<uint32_t> count{0};

    ASSERT_TRUE(sched.start([&count](uint32_t, uint32_t) { count++; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(210));
    sched.stop();

    /* Nominally 11 (first tick immediate); wide margin for loaded CI hosts */
    uint32_t n = count.load();
    EXPECT_GE(n, 6U);
    EXPECT_LE(n, 13U);
    EXPECT_EQ(sched.get_stats().ticks, n);
}

TEST(TickScheduler, TickIndicesAreSequential) {
    Tick_Scheduler sched(5);
    std::mutex m;
    std::vector<uint32_t> indices;

    ASSERT_TRUE(sched.start([&](uint32_t idx, uint32_t) {
        std::lock_guard<std::mutex> lock(m);
        indices.push_back(idx);
    }));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    sched.stop();

    std::lock_guard<std::mutex> lock(m);
    ASSERT_FALSE(indices.empty());
    for (size_t i = 0; i < indices.size(); ++i) {
        EXPECT_EQ(indices[i], static_cast<uint32_t>(i));
    }
}

TEST(TickScheduler, SlowCallbackCountsMissedPeriods) {
    Tick_Scheduler sched(20);
    std::atomic<uint32_t> count{0};

    ASSERT_TRUE(sched.start([&count](uint32_t, uint32_t) {
        count++;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }));
    std::this_thread::sleep_for(std::chrono::milliseconds(180));
    sched.stop();

    TickStats st = sched.get_stats();
    EXPECT_GE(st.ticks, 1U);
    EXPECT_GE(st.missed, 1U);
    EXPECT_GE(st.max_callback_us, 40000U);
    /* Skipped periods are not replayed back-to-back */
    EXPECT_LE(count.load(), 5U);
}

TEST(TickScheduler, StartRejectsSecondStartAndEmptyCallback) {
    Tick_Scheduler sched(50);
    EXPECT_FALSE(sched.start(TickCallback()));
    EXPECT_FALSE(sched.running());

    ASSERT_TRUE(sched.start([](uint32_t, uint32_t) {}));
    EXPECT_TRUE(sched.running());
    EXPECT_FALSE(sched.start([](uint32_t, uint32_t) {}));
    sched.stop();
    EXPECT_FALSE(sched.running());
}

TEST(TickScheduler, StopIsIdempotentAndPromptlyWakes) {
    Tick_Scheduler sched(10000);   /* 10 s period: stop must not wait it out */
    ASSERT_TRUE(sched.start([](uint32_t, uint32_t) {}));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto t0 = std::chrono::steady_clock::now();
    sched.stop();
    auto elapsed = std::chrono::steady_clock::now() - t0;
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 1000);

    sched.stop();
    EXPECT_EQ(sched.get_stats().ticks, 1U);
}

TEST(TickScheduler, RestartResetsStats) {
    Tick_Scheduler sched(10000);
    ASSERT_TRUE(sched.start([](uint32_t, uint32_t) {}));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    sched.stop();

    std::atomic<uint32_t> first_index{UINT32_MAX};
    ASSERT_TRUE(sched.start([&first_index](uint32_t idx, uint32_t) {
        first_index.store(idx);
    }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    sched.stop();

    EXPECT_EQ(first_index.load(), 0U);
    EXPECT_EQ(sched.get_stats().ticks, 1U);
}

TEST(TickScheduler, ZeroPeriodClampedToOneMs) {
    Tick_Scheduler sched(0);
    EXPECT_EQ(sched.period_ms(), 1U);
}
