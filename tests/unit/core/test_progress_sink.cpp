/**
 * @file test_progress_sink.cpp
 * @brief Unit tests for progress_sink
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/core/logging.h>
#include <kcenon/resumable_upload/core/progress_sink.h>

#include <stdexcept>
#include <vector>

namespace kcenon::resumable_upload::test {

class ProgressSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_level(log_level::fatal);
        sink_.set_callbacks(
            [this](const progress_snapshot& p) { progress_.push_back(p); },
            [this](const upload_error& e) { errors_.push_back(e); });
    }

    void TearDown() override {
        get_logger().set_level(log_level::info);
    }

    progress_sink sink_;
    std::vector<progress_snapshot> progress_;
    std::vector<upload_error> errors_;
};

TEST_F(ProgressSinkTest, StatusText) {
    EXPECT_STREQ(to_string(upload_status::splitting_chunks), "Splitting Chunks");
    EXPECT_STREQ(to_string(upload_status::uploading_chunks), "Uploading Chunks");
    EXPECT_STREQ(to_string(upload_status::paused), "Paused");
    EXPECT_STREQ(to_string(upload_status::completed), "Completed");
    EXPECT_STREQ(to_string(upload_status::connection_lost), "Connection Lost");
    EXPECT_STREQ(to_string(upload_status::aborted), "Aborted");
}

TEST_F(ProgressSinkTest, InitialSnapshot) {
    auto snapshot = sink_.snapshot();
    EXPECT_TRUE(snapshot.status.empty());
    EXPECT_DOUBLE_EQ(snapshot.upload_percentage, 0.0);
    EXPECT_EQ(snapshot.total_chunks, 0u);
    EXPECT_FALSE(snapshot.is_completed);
}

TEST_F(ProgressSinkTest, MergesPartialUpdates) {
    sink_.emit_progress(progress_update{"Starting upload. Total chunks: 4", 1u, 4u, 0.0,
                                        std::nullopt});
    sink_.emit_progress(upload_status::uploading_chunks);

    ASSERT_EQ(progress_.size(), 2u);
    EXPECT_EQ(progress_[1].status, "Uploading Chunks");
    EXPECT_EQ(progress_[1].total_chunks, 4u);
    EXPECT_EQ(progress_[1].current_chunk_index, 1u);
    EXPECT_DOUBLE_EQ(progress_[1].upload_percentage, 0.0);
}

TEST_F(ProgressSinkTest, ChunkIndexSetsChunksUploaded) {
    sink_.emit_progress(progress_update{"Uploading: 50.0%", 3u, 4u, 50.0, std::nullopt});

    auto snapshot = sink_.snapshot();
    EXPECT_EQ(snapshot.current_chunk_index, 3u);
    EXPECT_EQ(snapshot.chunks_uploaded, 2u);
}

TEST_F(ProgressSinkTest, ZeroChunkIndexLeavesChunksUploaded) {
    sink_.emit_progress(progress_update{"a", 3u, std::nullopt, std::nullopt, std::nullopt});
    sink_.emit_progress(progress_update{"b", 0u, std::nullopt, std::nullopt, std::nullopt});

    auto snapshot = sink_.snapshot();
    EXPECT_EQ(snapshot.current_chunk_index, 0u);
    EXPECT_EQ(snapshot.chunks_uploaded, 2u);
}

TEST_F(ProgressSinkTest, CompletedFlag) {
    sink_.emit_progress(progress_update{"Completed", 4u, 4u, 100.0, true});

    ASSERT_EQ(progress_.size(), 1u);
    EXPECT_TRUE(progress_[0].is_completed);
    EXPECT_DOUBLE_EQ(progress_[0].upload_percentage, 100.0);
}

TEST_F(ProgressSinkTest, EmitErrorForwards) {
    sink_.emit_error(upload_error{upload_error_kind::transient, error_code::http_status_error,
                                  "HTTP Error: 500", 2u, 1u});

    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].kind, upload_error_kind::transient);
    EXPECT_EQ(errors_[0].chunk_index.value(), 2u);
    EXPECT_EQ(errors_[0].remaining_attempts.value(), 1u);
}

TEST_F(ProgressSinkTest, ThrowingProgressCallbackBecomesError) {
    sink_.set_callbacks(
        [](const progress_snapshot&) { throw std::runtime_error("listener broke"); },
        [this](const upload_error& e) { errors_.push_back(e); });

    sink_.emit_progress(upload_status::paused);

    ASSERT_EQ(errors_.size(), 1u);
    EXPECT_EQ(errors_[0].message, "Error emitting progress: listener broke");
    EXPECT_EQ(sink_.snapshot().status, "Paused");
}

TEST_F(ProgressSinkTest, ThrowingErrorCallbackIsContained) {
    sink_.set_callbacks(nullptr, [](const upload_error&) {
        throw std::runtime_error("error listener broke");
    });

    EXPECT_NO_THROW(sink_.emit_error(upload_error{}));
}

TEST_F(ProgressSinkTest, ResetKeepsCallbacks) {
    sink_.emit_progress(progress_update{"x", 2u, 4u, 25.0, std::nullopt});

    sink_.reset();

    EXPECT_EQ(sink_.snapshot().total_chunks, 0u);
    sink_.emit_progress(upload_status::aborted);
    EXPECT_EQ(progress_.size(), 2u);
}

TEST_F(ProgressSinkTest, DisposeDropsCallbacks) {
    sink_.dispose();

    sink_.emit_progress(upload_status::completed);
    sink_.emit_error(upload_error{});

    EXPECT_TRUE(sink_.is_disposed());
    EXPECT_TRUE(progress_.empty());
    EXPECT_TRUE(errors_.empty());
    EXPECT_EQ(sink_.snapshot().status, "Completed");
}

}  // namespace kcenon::resumable_upload::test
