/**
 * @file test_upload_scenarios.cpp
 * @brief End-to-end upload scenarios against a scripted transport
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <algorithm>

namespace kcenon::resumable_upload::test {

class UploadScenarioTest : public UploaderFixture {};

// =============================================================================
// Happy path
// =============================================================================

TEST_F(UploadScenarioTest, TenChunksUploadInOrder) {
    build_uploader();
    start_chunks(10);

    scheduler_->run_ready();

    auto sent = transport_->sent();
    ASSERT_EQ(sent.size(), 10u);
    for (uint32_t i = 0; i < sent.size(); ++i) {
        EXPECT_EQ(sent[i].chunk_index, i + 1);
        EXPECT_EQ(sent[i].range.start, i * chunk_size);
        EXPECT_EQ(sent[i].range.end, (i + 1) * chunk_size);
        EXPECT_EQ(sent[i].body_size, chunk_size);
    }

    auto last = recorder_->last_progress();
    EXPECT_EQ(last.status, "Completed");
    EXPECT_DOUBLE_EQ(last.upload_percentage, 100.0);
    EXPECT_EQ(last.current_chunk_index, 10u);
    EXPECT_TRUE(last.is_completed);

    auto snapshot = uploader().state_snapshot();
    EXPECT_TRUE(snapshot.completed);
    EXPECT_EQ(snapshot.current_chunk, 10u);
    EXPECT_FALSE(snapshot.uploading);
    EXPECT_TRUE(recorder_->errors.empty());
}

TEST_F(UploadScenarioTest, ChunkHeadersDescribeByteRange) {
    build_uploader();
    auto started = uploader().start(make_source(2 * chunk_size + 100), upload_url);
    ASSERT_TRUE(started.has_value());

    scheduler_->run_ready();

    auto sent = transport_->sent();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0].content_range, "bytes 0-1023/2148");
    EXPECT_EQ(sent[1].content_range, "bytes 1024-2047/2148");
    EXPECT_EQ(sent[2].content_range, "bytes 2048-2147/2148");
    EXPECT_EQ(sent[2].body_size, 100u);
    for (const auto& request : sent) {
        EXPECT_EQ(request.content_type, "application/octet-stream");
    }
}

TEST_F(UploadScenarioTest, ProgressAnnouncesEachChunk) {
    build_uploader();
    start_chunks(4);

    scheduler_->run_ready();

    EXPECT_TRUE(recorder_->has_status("Chunk 1 completed. Starting chunk 2/4"));
    EXPECT_TRUE(recorder_->has_status("Chunk 3 completed. Starting chunk 4/4"));
    EXPECT_FALSE(recorder_->has_status("Chunk 4 completed. Starting chunk 5/4"));
    EXPECT_TRUE(recorder_->has_status("Uploading: 12.5%"));
    EXPECT_TRUE(recorder_->has_status("Uploading: 100.0%"));
    EXPECT_EQ(recorder_->count_status_prefix("Uploading: "), 8u);
}

TEST_F(UploadScenarioTest, PercentageNeverDecreases) {
    build_uploader();
    start_chunks(5);

    scheduler_->run_ready();

    double previous = 0.0;
    std::lock_guard lock(recorder_->mutex);
    for (const auto& p : recorder_->progress) {
        EXPECT_GE(p.upload_percentage, previous) << p.status;
        previous = p.upload_percentage;
    }
}

TEST_F(UploadScenarioTest, SingleChunkFileCompletesOnFirstResponse) {
    build_uploader();
    auto started = uploader().start(make_source(10), upload_url);
    ASSERT_TRUE(started.has_value());

    scheduler_->run_ready();

    ASSERT_EQ(transport_->send_count(), 1u);
    EXPECT_EQ(transport_->sent()[0].content_range, "bytes 0-9/10");
    EXPECT_TRUE(uploader().state_snapshot().completed);
}

TEST_F(UploadScenarioTest, CreatedStatusAcceptedForIntermediateChunk) {
    build_uploader();
    transport_->set_responder(
        [](const chunk_request& request, uint32_t)
            -> std::optional<result<transport_response>> {
            return response_with(request.chunk_index == 1 ? 201 : 200);
        });
    start_chunks(2);

    scheduler_->run_ready();

    EXPECT_TRUE(uploader().state_snapshot().completed);
    EXPECT_EQ(transport_->send_count(), 2u);
}

// =============================================================================
// Retries
// =============================================================================

TEST_F(UploadScenarioTest, TransientFailuresRetryWithGrowingDelay) {
    build_uploader();
    transport_->set_responder(
        [](const chunk_request& request, uint32_t attempt)
            -> std::optional<result<transport_response>> {
            if (request.chunk_index == 3 && attempt <= 2) {
                return response_with(503);
            }
            return response_with(request.range.end == request.file_length ? 200 : 308);
        });
    start_chunks(5);

    scheduler_->run_ready();
    EXPECT_EQ(transport_->send_count_for(3), 1u);
    EXPECT_EQ(uploader().phase(), upload_phase::awaiting_retry);
    EXPECT_EQ(uploader().retry_attempts(3), 1u);
    EXPECT_TRUE(recorder_->has_status("Retrying chunk 3. Attempt 1/3"));

    scheduler_->advance(999ms);
    EXPECT_EQ(transport_->send_count_for(3), 1u);
    scheduler_->advance(1ms);
    EXPECT_EQ(transport_->send_count_for(3), 2u);
    EXPECT_EQ(uploader().retry_attempts(3), 2u);

    // Second delay is twice the base delay
    scheduler_->advance(1999ms);
    EXPECT_EQ(transport_->send_count_for(3), 2u);
    scheduler_->advance(1ms);
    EXPECT_EQ(transport_->send_count_for(3), 3u);

    EXPECT_TRUE(uploader().state_snapshot().completed);
    EXPECT_EQ(uploader().retry_attempts(3), 0u);

    auto transient = recorder_->errors_of(upload_error_kind::transient);
    ASSERT_EQ(transient.size(), 2u);
    EXPECT_EQ(transient[0].message, "HTTP Error: 503. Retrying... (2 attempts remaining)");
    EXPECT_EQ(transient[0].remaining_attempts.value(), 2u);
    EXPECT_EQ(transient[0].chunk_index.value(), 3u);
    EXPECT_EQ(transient[0].code, error_code::http_status_error);
    EXPECT_EQ(transient[1].remaining_attempts.value(), 1u);
    EXPECT_TRUE(recorder_->errors_of(upload_error_kind::terminal).empty());
}

TEST_F(UploadScenarioTest, RetryCounterResetsAfterSuccess) {
    build_uploader();
    transport_->set_responder(
        [](const chunk_request& request, uint32_t attempt)
            -> std::optional<result<transport_response>> {
            if (request.chunk_index == 1 && attempt == 1) {
                return response_with(500);
            }
            if (request.chunk_index == 2 && attempt == 1) {
                return std::nullopt;
            }
            return response_with(request.range.end == request.file_length ? 200 : 308);
        });
    start_chunks(3);
    scheduler_->run_ready();
    ASSERT_EQ(uploader().retry_attempts(1), 1u);

    scheduler_->advance(1000ms);

    EXPECT_EQ(uploader().retry_attempts(1), 0u);
    EXPECT_TRUE(uploader().is_transfer_in_flight());
    EXPECT_EQ(uploader().state_snapshot().current_chunk, 1u);
}

TEST_F(UploadScenarioTest, TransportErrorCountsAsFailure) {
    build_uploader();
    transport_->set_responder(
        [](const chunk_request& request, uint32_t attempt)
            -> std::optional<result<transport_response>> {
            if (attempt == 1) {
                return failure_with(error_code::connection_failed, "Connection refused");
            }
            return response_with(request.range.end == request.file_length ? 200 : 308);
        });
    start_chunks(1);

    scheduler_->run_ready();
    scheduler_->advance(1000ms);

    auto transient = recorder_->errors_of(upload_error_kind::transient);
    ASSERT_EQ(transient.size(), 1u);
    EXPECT_EQ(transient[0].code, error_code::connection_failed);
    EXPECT_EQ(transient[0].message, "Connection refused. Retrying... (2 attempts remaining)");
    EXPECT_TRUE(uploader().state_snapshot().completed);
}

TEST_F(UploadScenarioTest, FinalChunkRedirectIsFailure) {
    build_uploader();
    transport_->set_responder(
        [](const chunk_request& request, uint32_t attempt)
            -> std::optional<result<transport_response>> {
            if (request.chunk_index == 2 && attempt == 1) {
                return response_with(308);
            }
            return response_with(request.range.end == request.file_length ? 200 : 308);
        });
    start_chunks(2);

    scheduler_->run_ready();

    EXPECT_FALSE(uploader().state_snapshot().completed);
    ASSERT_EQ(recorder_->errors_of(upload_error_kind::transient).size(), 1u);

    scheduler_->advance(1000ms);
    EXPECT_TRUE(uploader().state_snapshot().completed);
}

TEST_F(UploadScenarioTest, SingleAttemptBudgetStopsAfterFirstFailure) {
    build_uploader([](resumable_uploader::builder& b) { b.with_max_retries(1); });
    transport_->set_responder(
        [](const chunk_request& request, uint32_t)
            -> std::optional<result<transport_response>> {
            if (request.chunk_index == 2) {
                return response_with(500);
            }
            return response_with(308);
        });
    start_chunks(4);

    scheduler_->run_ready();
    scheduler_->advance(60000ms);

    EXPECT_EQ(transport_->send_count_for(2), 1u);
    EXPECT_EQ(transport_->send_count_for(3), 0u);
    EXPECT_EQ(uploader().phase(), upload_phase::stalled);
    EXPECT_FALSE(uploader().state_snapshot().completed);
    EXPECT_TRUE(recorder_->errors_of(upload_error_kind::transient).empty());

    auto terminal = recorder_->errors_of(upload_error_kind::terminal);
    ASSERT_EQ(terminal.size(), 1u);
    EXPECT_EQ(terminal[0].code, error_code::retry_exhausted);
    EXPECT_EQ(terminal[0].message, "Upload failed after 1 attempts for chunk 2. HTTP Error: 500");
    EXPECT_EQ(terminal[0].remaining_attempts.value(), 0u);
}

TEST_F(UploadScenarioTest, RetriesExhaustedAfterMaxAttempts) {
    build_uploader();
    transport_->set_responder(
        [](const chunk_request&, uint32_t) -> std::optional<result<transport_response>> {
            return response_with(502);
        });
    start_chunks(2);

    scheduler_->run_ready();
    scheduler_->advance(1000ms);
    scheduler_->advance(2000ms);
    scheduler_->advance(60000ms);

    EXPECT_EQ(transport_->send_count_for(1), 3u);
    EXPECT_EQ(recorder_->errors_of(upload_error_kind::transient).size(), 2u);
    ASSERT_EQ(recorder_->errors_of(upload_error_kind::terminal).size(), 1u);
    EXPECT_EQ(uploader().phase(), upload_phase::stalled);
}

TEST_F(UploadScenarioTest, StalledUploadCanBeAbortedAndRestarted) {
    build_uploader([](resumable_uploader::builder& b) { b.with_max_retries(1); });
    transport_->set_responder(
        [](const chunk_request& request, uint32_t attempt)
            -> std::optional<result<transport_response>> {
            if (attempt == 1) {
                return response_with(500);
            }
            return response_with(request.range.end == request.file_length ? 200 : 308);
        });
    start_chunks(1);
    scheduler_->run_ready();
    ASSERT_EQ(uploader().phase(), upload_phase::stalled);

    uploader().abort();
    start_chunks(1);
    scheduler_->run_ready();

    EXPECT_TRUE(uploader().state_snapshot().completed);
}

TEST_F(UploadScenarioTest, PauseAndResumeDoNotRefillExhaustedBudget) {
    build_uploader([](resumable_uploader::builder& b) { b.with_max_retries(1); });
    transport_->set_responder(
        [](const chunk_request& request, uint32_t) -> std::optional<result<transport_response>> {
            if (request.chunk_index == 2) {
                return response_with(500);
            }
            return response_with(308);
        });
    start_chunks(3);
    scheduler_->run_ready();
    ASSERT_EQ(uploader().phase(), upload_phase::stalled);

    ASSERT_TRUE(uploader().pause().has_value());
    EXPECT_EQ(uploader().phase(), upload_phase::suspended);
    ASSERT_TRUE(uploader().resume().has_value());
    scheduler_->advance(1000ms);

    EXPECT_EQ(transport_->send_count_for(2), 1u);
    EXPECT_EQ(uploader().retry_attempts(2), 1u);
    EXPECT_EQ(uploader().phase(), upload_phase::stalled);

    auto terminal = recorder_->errors_of(upload_error_kind::terminal);
    ASSERT_EQ(terminal.size(), 2u);
    EXPECT_EQ(terminal[1].code, error_code::retry_exhausted);
    EXPECT_EQ(terminal[1].message,
              "Upload failed after 1 attempts. Chunk 2 could not be uploaded.");
}

// =============================================================================
// Abort
// =============================================================================

TEST_F(UploadScenarioTest, AbortMidTransferThenFreshStart) {
    build_uploader();
    transport_->set_responder(
        [this](const chunk_request& request, uint32_t)
            -> std::optional<result<transport_response>> {
            if (request.chunk_index == 3 && transport_->send_count() == 3) {
                return std::nullopt;
            }
            return response_with(request.range.end == request.file_length ? 200 : 308);
        });
    start_chunks(5);
    scheduler_->run_ready();
    ASSERT_TRUE(uploader().is_transfer_in_flight());

    uploader().abort();
    scheduler_->run_ready();

    EXPECT_EQ(recorder_->aborts, 1);
    EXPECT_TRUE(recorder_->has_status("Aborted"));
    EXPECT_TRUE(uploader().state_snapshot().aborted);
    EXPECT_FALSE(uploader().state_snapshot().initialized);
    EXPECT_EQ(transport_->cancellations(), 1);
    EXPECT_TRUE(recorder_->errors.empty());
    EXPECT_EQ(uploader().progress().total_chunks, 0u);

    start_chunks(5);
    scheduler_->run_ready();

    auto sent = transport_->sent();
    ASSERT_EQ(sent.size(), 8u);
    EXPECT_EQ(sent[3].chunk_index, 1u);
    EXPECT_EQ(sent[3].range.start, 0u);
    EXPECT_GT(sent[3].generation, sent[2].generation);
    EXPECT_TRUE(uploader().state_snapshot().completed);
    EXPECT_FALSE(uploader().state_snapshot().aborted);
}

TEST_F(UploadScenarioTest, LateResponseAfterAbortIsIgnored) {
    build_uploader();
    transport_->set_responder(
        [](const chunk_request&, uint32_t) -> std::optional<result<transport_response>> {
            return std::nullopt;
        });
    start_chunks(2);
    scheduler_->run_ready();

    uploader().abort();
    transport_->complete_pending(response_with(308));
    scheduler_->run_ready();

    EXPECT_EQ(uploader().state_snapshot().current_chunk, 0u);
    EXPECT_EQ(transport_->send_count(), 1u);
    EXPECT_TRUE(recorder_->errors.empty());
}

// =============================================================================
// Isolation
// =============================================================================

TEST_F(UploadScenarioTest, IndependentUploadersDoNotShareProgress) {
    build_uploader();

    auto other_transport = std::make_shared<fake_transport>();
    auto other_connectivity = std::make_shared<fake_connectivity_source>(true);
    std::vector<std::string> other_statuses;
    auto other = resumable_uploader::builder()
        .with_chunk_size(chunk_size)
        .with_chunk_size_bounds(chunk_size_bounds{1, 1024 * 1024})
        .with_scheduler(scheduler_)
        .with_transport(other_transport)
        .with_connectivity_source(other_connectivity)
        .with_on_progress([&other_statuses](const progress_snapshot& p) {
            other_statuses.push_back(p.status);
        })
        .build();
    ASSERT_TRUE(other.has_value());

    start_chunks(2);
    auto started = other->start(make_source(3 * chunk_size), upload_url);
    ASSERT_TRUE(started.has_value());
    scheduler_->run_ready();

    EXPECT_EQ(uploader().progress().total_chunks, 2u);
    EXPECT_EQ(other->progress().total_chunks, 3u);
    EXPECT_TRUE(uploader().state_snapshot().completed);
    EXPECT_TRUE(other->state_snapshot().completed);
    EXPECT_EQ(transport_->send_count(), 2u);
    EXPECT_EQ(other_transport->send_count(), 3u);
    EXPECT_FALSE(recorder_->has_status("Starting upload. Total chunks: 3"));
    EXPECT_NE(std::find(other_statuses.begin(), other_statuses.end(),
                        "Starting upload. Total chunks: 3"), other_statuses.end());
}

}  // namespace kcenon::resumable_upload::test
