/**
 * @file test_network_monitor.cpp
 * @brief Unit tests for the debounced connectivity monitor
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <vector>

namespace kcenon::resumable_upload::test {

class NetworkMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_level(log_level::error);
        scheduler_ = std::make_shared<manual_scheduler>();
        source_ = std::make_shared<fake_connectivity_source>(true);
        monitor_ = std::make_unique<network_monitor>(
            scheduler_, source_, network_monitor_config{500ms, 2000ms});
    }

    void TearDown() override {
        monitor_.reset();
        get_logger().set_level(log_level::info);
    }

    void start() {
        monitor_->start_monitoring([this](bool connected) { reports_.push_back(connected); });
    }

    std::shared_ptr<manual_scheduler> scheduler_;
    std::shared_ptr<fake_connectivity_source> source_;
    std::unique_ptr<network_monitor> monitor_;
    std::vector<bool> reports_;
};

TEST_F(NetworkMonitorTest, StartsIdle) {
    EXPECT_EQ(monitor_->state(), monitor_state::idle);
    EXPECT_FALSE(monitor_->is_monitoring());
    EXPECT_FALSE(monitor_->last_reported().has_value());
    EXPECT_EQ(monitor_->config().debounce_delay, 500ms);
}

TEST_F(NetworkMonitorTest, InitialProbeReportedOnce) {
    start();
    EXPECT_TRUE(monitor_->is_monitoring());
    EXPECT_TRUE(source_->is_watched());
    EXPECT_TRUE(reports_.empty());

    scheduler_->run_ready();

    EXPECT_EQ(reports_, std::vector<bool>{true});
    EXPECT_EQ(monitor_->state(), monitor_state::settled);
    EXPECT_EQ(monitor_->last_reported(), std::optional<bool>(true));
}

TEST_F(NetworkMonitorTest, InitialProbeReportsOffline) {
    source_ = std::make_shared<fake_connectivity_source>(false);
    monitor_ = std::make_unique<network_monitor>(
        scheduler_, source_, network_monitor_config{500ms, 2000ms});

    start();
    scheduler_->run_ready();

    EXPECT_EQ(reports_, std::vector<bool>{false});
}

TEST_F(NetworkMonitorTest, ChangeReportedAfterDebounceAndStability) {
    start();
    scheduler_->run_ready();

    source_->set_connected(false);
    EXPECT_EQ(monitor_->state(), monitor_state::debouncing);

    scheduler_->advance(499ms);
    EXPECT_EQ(monitor_->state(), monitor_state::debouncing);

    scheduler_->advance(1ms);
    EXPECT_EQ(monitor_->state(), monitor_state::confirming);

    scheduler_->advance(1999ms);
    EXPECT_EQ(reports_.size(), 1u);

    scheduler_->advance(1ms);
    EXPECT_EQ(reports_, (std::vector<bool>{true, false}));
}

TEST_F(NetworkMonitorTest, UnchangedResultNotReported) {
    start();
    scheduler_->run_ready();

    source_->raise_change();
    scheduler_->advance(2500ms);

    EXPECT_EQ(reports_, std::vector<bool>{true});
    EXPECT_EQ(monitor_->state(), monitor_state::settled);
}

TEST_F(NetworkMonitorTest, FlappingCollapsesToFinalState) {
    start();
    scheduler_->run_ready();
    auto probes_before = source_->probes();

    source_->set_connected(false);
    scheduler_->advance(200ms);
    source_->set_connected(true);
    scheduler_->advance(200ms);
    source_->set_connected(false);
    scheduler_->advance(300ms);
    source_->set_connected(true);

    scheduler_->advance(2500ms);

    EXPECT_EQ(reports_, std::vector<bool>{true});
    EXPECT_EQ(source_->probes(), probes_before + 1);
}

TEST_F(NetworkMonitorTest, ChangeDuringStabilityWindowRestartsFilter) {
    start();
    scheduler_->run_ready();

    source_->set_connected(false);
    scheduler_->advance(500ms);
    ASSERT_EQ(monitor_->state(), monitor_state::confirming);

    scheduler_->advance(1000ms);
    source_->set_connected(true);
    scheduler_->advance(1500ms);

    // First window was abandoned and the restarted one has not elapsed yet
    EXPECT_EQ(reports_, std::vector<bool>{true});
    EXPECT_EQ(monitor_->state(), monitor_state::confirming);

    scheduler_->advance(1000ms);
    EXPECT_EQ(reports_, std::vector<bool>{true});
}

TEST_F(NetworkMonitorTest, StopCancelsPendingWork) {
    start();
    scheduler_->run_ready();
    source_->set_connected(false);

    monitor_->stop_monitoring();
    scheduler_->advance(5000ms);

    EXPECT_EQ(reports_, std::vector<bool>{true});
    EXPECT_FALSE(monitor_->is_monitoring());
    EXPECT_FALSE(source_->is_watched());
    EXPECT_EQ(monitor_->state(), monitor_state::idle);
    EXPECT_EQ(scheduler_->pending(), 0u);
}

TEST_F(NetworkMonitorTest, StopIsIdempotent) {
    monitor_->stop_monitoring();
    start();
    monitor_->stop_monitoring();
    monitor_->stop_monitoring();
    EXPECT_FALSE(monitor_->is_monitoring());
}

TEST_F(NetworkMonitorTest, RestartReprobes) {
    start();
    scheduler_->run_ready();

    start();
    scheduler_->run_ready();

    EXPECT_EQ(reports_, (std::vector<bool>{true, true}));
}

TEST_F(NetworkMonitorTest, RawChangeIgnoredWhenNotMonitoring) {
    monitor_->notify_raw_change();

    EXPECT_EQ(monitor_->state(), monitor_state::idle);
    EXPECT_EQ(scheduler_->pending(), 0u);
}

TEST_F(NetworkMonitorTest, DestroyingMonitorUnwatches) {
    start();
    monitor_.reset();

    EXPECT_FALSE(source_->is_watched());
    scheduler_->advance(5000ms);
    EXPECT_TRUE(reports_.empty());
}

}  // namespace kcenon::resumable_upload::test
