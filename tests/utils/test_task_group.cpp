/**
 * @file test_task_group.cpp
 * @brief Unit tests for the bounded fan-out helper
 */

#include <gtest/gtest.h>
#include <certstalker/utils/task_group.h>

#include <atomic>
#include <set>
#include <stdexcept>

using namespace certstalker::utils;
using namespace std::chrono;

class TaskGroupTest : public ::testing::Test {
protected:
    // Test setup if needed
};

TEST_F(TaskGroupTest, Empty_ReturnsNoOutcomes) {
    TaskGroup<int> group(4);
    EXPECT_TRUE(group.run(std::nullopt).empty());
}

TEST_F(TaskGroupTest, OutcomesInAddOrder) {
    TaskGroup<int> group(3);
    for (int i = 0; i < 10; ++i) {
        group.add([i](const CancellationToken&) {
            std::this_thread::sleep_for(milliseconds((10 - i) * 2));
            return i * i;
        });
    }

    auto outcomes = group.run(std::nullopt);
    ASSERT_EQ(outcomes.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(outcomes[i].state, TaskState::COMPLETED);
        EXPECT_EQ(*outcomes[i].value, i * i);
    }
}

TEST_F(TaskGroupTest, ConcurrencyIsBounded) {
    auto active = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);

    TaskGroup<int> group(2);
    for (int i = 0; i < 8; ++i) {
        group.add([active, peak](const CancellationToken&) {
            int now = ++(*active);
            int seen = peak->load();
            while (now > seen && !peak->compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(milliseconds(20));
            --(*active);
            return 0;
        });
    }

    group.run(std::nullopt);
    EXPECT_LE(peak->load(), 2);
    EXPECT_GE(peak->load(), 1);
}

TEST_F(TaskGroupTest, ThrowingTaskIsFailedNotLost) {
    TaskGroup<int> group(2);
    group.add([](const CancellationToken&) { return 1; });
    group.add([](const CancellationToken&) -> int { throw std::runtime_error("boom"); });

    auto outcomes = group.run(std::nullopt);
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].state, TaskState::COMPLETED);
    EXPECT_EQ(outcomes[1].state, TaskState::FAILED);
    EXPECT_EQ(outcomes[1].error, "boom");
    EXPECT_FALSE(outcomes[1].value.has_value());
}

TEST_F(TaskGroupTest, DeadlineAbandonsSlowTasks) {
    TaskGroup<int> group(2);
    group.add([](const CancellationToken&) { return 1; });
    group.add([](const CancellationToken& token) {
        token.sleepFor(seconds(10));
        return 2;
    });

    auto start = steady_clock::now();
    auto outcomes = group.run(steady_clock::now() + milliseconds(200));
    auto elapsed = steady_clock::now() - start;

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].state, TaskState::COMPLETED);
    EXPECT_EQ(outcomes[1].state, TaskState::ABANDONED);
    EXPECT_LT(elapsed, seconds(5));
}

TEST_F(TaskGroupTest, DeadlineAbandonsQueuedTasks) {
    TaskGroup<int> group(1);
    for (int i = 0; i < 5; ++i) {
        group.add([](const CancellationToken& token) {
            token.sleepFor(milliseconds(300));
            return 0;
        });
    }

    auto outcomes = group.run(steady_clock::now() + milliseconds(100));
    ASSERT_EQ(outcomes.size(), 5u);
    for (const auto& outcome : outcomes) {
        EXPECT_EQ(outcome.state, TaskState::ABANDONED);
    }
}

TEST_F(TaskGroupTest, AbandonedWorkerTrackedUntilItReturns) {
    auto& tracker = WorkerTracker::instance();
    ASSERT_TRUE(tracker.waitForIdle(seconds(5)));

    auto released = std::make_shared<std::atomic<bool>>(false);
    {
        TaskGroup<int> group(1);
        // Ignores the token, like a blocking network call
        group.add([released](const CancellationToken&) {
            std::this_thread::sleep_for(milliseconds(300));
            return 1;
        });
        auto outcomes = group.run(steady_clock::now() + milliseconds(50));
        EXPECT_EQ(outcomes[0].state, TaskState::ABANDONED);
    }

    EXPECT_GE(tracker.running(), 1u);
    EXPECT_FALSE(tracker.waitForIdle(milliseconds(10)));
    EXPECT_TRUE(tracker.waitForIdle(seconds(5)));
    EXPECT_EQ(tracker.running(), 0u);
    // The finished worker has dropped everything its task captured
    EXPECT_EQ(released.use_count(), 1);
}

TEST_F(TaskGroupTest, CancellationToken_SleepWakesEarly) {
    CancellationToken token;
    std::thread canceller([token]() {
        std::this_thread::sleep_for(milliseconds(50));
        token.cancel();
    });

    auto start = steady_clock::now();
    EXPECT_FALSE(token.sleepFor(seconds(10)));
    EXPECT_LT(steady_clock::now() - start, seconds(5));
    canceller.join();
}

TEST_F(TaskGroupTest, CancellationToken_FullSleep) {
    CancellationToken token;
    EXPECT_TRUE(token.sleepFor(milliseconds(10)));
}
