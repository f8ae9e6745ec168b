/**
 * @file test_manual_scheduler.cpp
 * @brief Unit tests for the virtual-clock scheduler
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/scheduling/manual_scheduler.h>

#include <string>
#include <vector>

namespace kcenon::resumable_upload::test {

using namespace std::chrono_literals;

class ManualSchedulerTest : public ::testing::Test {
protected:
    manual_scheduler scheduler_;
    std::vector<std::string> order_;
};

TEST_F(ManualSchedulerTest, PostedTaskWaitsForRunReady) {
    scheduler_.post([this] { order_.push_back("a"); });

    EXPECT_TRUE(order_.empty());
    EXPECT_EQ(scheduler_.pending(), 1u);

    EXPECT_EQ(scheduler_.run_ready(), 1u);
    EXPECT_EQ(order_, std::vector<std::string>{"a"});
    EXPECT_EQ(scheduler_.pending(), 0u);
}

TEST_F(ManualSchedulerTest, DelayedTaskRunsWhenDue) {
    scheduler_.post_delayed([this] { order_.push_back("late"); }, 1000ms);

    scheduler_.advance(999ms);
    EXPECT_TRUE(order_.empty());

    scheduler_.advance(1ms);
    EXPECT_EQ(order_, std::vector<std::string>{"late"});
}

TEST_F(ManualSchedulerTest, RunsInDueThenPostOrder) {
    scheduler_.post_delayed([this] { order_.push_back("b"); }, 200ms);
    scheduler_.post_delayed([this] { order_.push_back("a"); }, 100ms);
    scheduler_.post_delayed([this] { order_.push_back("c"); }, 200ms);

    scheduler_.advance(500ms);

    EXPECT_EQ(order_, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(ManualSchedulerTest, TasksPostedDuringAdvanceRunIfDue) {
    scheduler_.post_delayed([this] {
        order_.push_back("first");
        scheduler_.post_delayed([this] { order_.push_back("second"); }, 100ms);
        scheduler_.post_delayed([this] { order_.push_back("too late"); }, 1000ms);
    }, 100ms);

    EXPECT_EQ(scheduler_.advance(300ms), 2u);
    EXPECT_EQ(order_, (std::vector<std::string>{"first", "second"}));
    EXPECT_EQ(scheduler_.pending(), 1u);
}

TEST_F(ManualSchedulerTest, ClockAdvancesToTaskDueTime) {
    auto start = scheduler_.now();
    task_scheduler::clock::time_point seen;
    scheduler_.post_delayed([&] { seen = scheduler_.now(); }, 250ms);

    scheduler_.advance(1000ms);

    EXPECT_EQ(seen - start, 250ms);
    EXPECT_EQ(scheduler_.now() - start, 1000ms);
}

TEST_F(ManualSchedulerTest, CancelledTaskNeverRuns) {
    auto handle = scheduler_.post_delayed([this] { order_.push_back("x"); }, 100ms);
    EXPECT_TRUE(handle.is_pending());

    handle.cancel();

    EXPECT_FALSE(handle.is_pending());
    EXPECT_EQ(scheduler_.pending(), 0u);
    scheduler_.advance(200ms);
    EXPECT_TRUE(order_.empty());
}

TEST_F(ManualSchedulerTest, HandleNotPendingAfterRun) {
    auto handle = scheduler_.post([] {});
    scheduler_.run_ready();

    EXPECT_FALSE(handle.is_pending());
    handle.cancel();
}

TEST_F(ManualSchedulerTest, DefaultHandleIsInert) {
    timer_handle handle;
    EXPECT_FALSE(handle.is_pending());
    handle.cancel();
}

TEST_F(ManualSchedulerTest, NextDueIn) {
    EXPECT_FALSE(scheduler_.next_due_in().has_value());

    scheduler_.post_delayed([] {}, 700ms);
    scheduler_.post_delayed([] {}, 300ms);

    ASSERT_TRUE(scheduler_.next_due_in().has_value());
    EXPECT_EQ(*scheduler_.next_due_in(), 300ms);

    scheduler_.advance(100ms);
    EXPECT_EQ(*scheduler_.next_due_in(), 200ms);
}

TEST_F(ManualSchedulerTest, NegativeDelayRunsImmediately) {
    scheduler_.post_delayed([this] { order_.push_back("now"); }, -50ms);

    scheduler_.run_ready();

    EXPECT_EQ(order_, std::vector<std::string>{"now"});
}

}  // namespace kcenon::resumable_upload::test
