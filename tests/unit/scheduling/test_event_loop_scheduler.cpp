/**
 * @file test_event_loop_scheduler.cpp
 * @brief Unit tests for the worker thread scheduler
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/core/logging.h>
#include <kcenon/resumable_upload/scheduling/event_loop_scheduler.h>

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::resumable_upload::test {

using namespace std::chrono_literals;

class EventLoopSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler_ = event_loop_scheduler::create("test_loop");
    }

    void TearDown() override {
        scheduler_->stop();
    }

    std::shared_ptr<event_loop_scheduler> scheduler_;
};

TEST_F(EventLoopSchedulerTest, RunsPostedTask) {
    std::promise<std::thread::id> ran;
    auto future = ran.get_future();

    scheduler_->post([&ran] { ran.set_value(std::this_thread::get_id()); });

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_NE(future.get(), std::this_thread::get_id());
}

TEST_F(EventLoopSchedulerTest, RunsTasksInOrderOnOneThread) {
    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> done;

    for (int i = 0; i < 10; ++i) {
        scheduler_->post([&, i] {
            std::lock_guard lock(mutex);
            order.push_back(i);
            if (i == 9) {
                done.set_value();
            }
        });
    }

    ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);
    std::lock_guard lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST_F(EventLoopSchedulerTest, DelayedTaskRunsAfterDelay) {
    auto start = std::chrono::steady_clock::now();
    std::promise<std::chrono::steady_clock::time_point> ran;
    auto future = ran.get_future();

    scheduler_->post_delayed([&ran] { ran.set_value(std::chrono::steady_clock::now()); }, 50ms);

    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_GE(future.get() - start, 50ms);
}

TEST_F(EventLoopSchedulerTest, EarlierDueRunsFirst) {
    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> done;

    scheduler_->post_delayed([&] {
        std::lock_guard lock(mutex);
        order.push_back(2);
        done.set_value();
    }, 80ms);
    scheduler_->post_delayed([&] {
        std::lock_guard lock(mutex);
        order.push_back(1);
    }, 20ms);

    ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);
    std::lock_guard lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(EventLoopSchedulerTest, CancelledTaskDoesNotRun) {
    std::atomic<bool> ran{false};
    std::promise<void> sentinel;

    auto handle = scheduler_->post_delayed([&ran] { ran = true; }, 30ms);
    handle.cancel();
    scheduler_->post_delayed([&sentinel] { sentinel.set_value(); }, 60ms);

    ASSERT_EQ(sentinel.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(ran.load());
}

TEST_F(EventLoopSchedulerTest, ThrowingTaskDoesNotStopLoop) {
    get_logger().set_level(log_level::fatal);
    std::promise<void> after;

    scheduler_->post([] { throw std::runtime_error("boom"); });
    scheduler_->post([&after] { after.set_value(); });

    EXPECT_EQ(after.get_future().wait_for(2s), std::future_status::ready);
    get_logger().set_level(log_level::info);
}

TEST_F(EventLoopSchedulerTest, StopDiscardsPendingTasks) {
    std::atomic<bool> ran{false};
    auto handle = scheduler_->post_delayed([&ran] { ran = true; }, 10s);

    scheduler_->stop();

    EXPECT_FALSE(scheduler_->is_running());
    EXPECT_FALSE(handle.is_pending());
    EXPECT_EQ(scheduler_->pending_tasks(), 0u);
    EXPECT_FALSE(ran.load());
}

TEST_F(EventLoopSchedulerTest, PostAfterStopIsCancelled) {
    scheduler_->stop();

    auto handle = scheduler_->post([] {});

    EXPECT_FALSE(handle.is_pending());
}

TEST_F(EventLoopSchedulerTest, StopIsIdempotent) {
    scheduler_->stop();
    scheduler_->stop();
    EXPECT_FALSE(scheduler_->is_running());
}

TEST_F(EventLoopSchedulerTest, StopFromOwnTask) {
    std::promise<void> stopped;

    scheduler_->post([this, &stopped] {
        scheduler_->stop();
        stopped.set_value();
    });

    ASSERT_EQ(stopped.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_FALSE(scheduler_->is_running());
}

}  // namespace kcenon::resumable_upload::test
