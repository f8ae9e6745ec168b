/**
 * @file test_http_upload_transport.cpp
 * @brief Unit tests for the HTTP PUT chunk transport
 */

#include <gtest/gtest.h>

#include <kcenon/resumable_upload/core/logging.h>
#include <kcenon/resumable_upload/scheduling/blocking_executor.h>
#include <kcenon/resumable_upload/transport/http_upload_transport.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace kcenon::resumable_upload::test {

using namespace std::chrono_literals;

class HttpUploadTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_level(log_level::fatal);
    }

    void TearDown() override {
        get_logger().set_level(log_level::info);
    }

    auto make_request() -> chunk_request {
        chunk_request request;
        request.url = "http://127.0.0.1:9/upload?sig=test";
        request.chunk_index = 1;
        request.range = byte_range{0, 16};
        request.file_length = 16;
        request.content_range = "bytes 0-15/16";
        request.body = chunk_bytes(16);
        return request;
    }
};

TEST_F(HttpUploadTransportTest, DefaultTimeouts) {
    transport_config config;
    EXPECT_EQ(config.connect_timeout, 30s);
    EXPECT_EQ(config.send_timeout, 60s);
    EXPECT_EQ(config.receive_timeout, 30s);
    EXPECT_EQ(config.request_timeout(), 120s);
}

TEST_F(HttpUploadTransportTest, KeepsConfig) {
    transport_config config;
    config.connect_timeout = 5s;
    http_upload_transport transport(config);

    EXPECT_EQ(transport.config().connect_timeout, 5s);
}

TEST_F(HttpUploadTransportTest, UnavailableBackendFailsRequest) {
    if (http_upload_transport::is_available()) {
        GTEST_SKIP() << "HTTP backend compiled in";
    }

    http_upload_transport transport;
    std::optional<result<transport_response>> outcome;

    transport.send(make_request(), cancellation_token{}, nullptr,
        [&outcome](result<transport_response> r) { outcome = std::move(r); });

    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, error_code::transport_unavailable);
}

TEST_F(HttpUploadTransportTest, CancelledTokenDeliversCancellation) {
    if (!http_upload_transport::is_available()) {
        GTEST_SKIP() << "HTTP backend not compiled in";
    }

    http_upload_transport transport;
    cancellation_token token;
    token.cancel();

    std::promise<result<transport_response>> delivered;
    auto future = delivered.get_future();
    transport.send(make_request(), token, nullptr,
        [&delivered](result<transport_response> r) { delivered.set_value(std::move(r)); });

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto outcome = future.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::transfer_cancelled);
}

TEST_F(HttpUploadTransportTest, CompletionDeliveredOnce) {
    if (!http_upload_transport::is_available()) {
        GTEST_SKIP() << "HTTP backend not compiled in";
    }

    std::atomic<int> completions{0};
    {
        http_upload_transport transport;
        cancellation_token token;
        transport.send(make_request(), token, nullptr,
            [&completions](result<transport_response>) { ++completions; });
        token.cancel();
    }

    // Cancellation is delivered as soon as the token is cancelled
    EXPECT_EQ(completions.load(), 1);
}

namespace {

/**
 * @brief Executor that keeps jobs until the test runs them
 */
class held_executor : public blocking_executor {
public:
    std::future<void> submit(std::function<void()> job) override {
        jobs.push_back(std::move(job));
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }

    [[nodiscard]] bool is_running() const override { return true; }

    std::vector<std::function<void()>> jobs;
};

}  // namespace

TEST_F(HttpUploadTransportTest, DestructionDoesNotWaitForQueuedRequest) {
    if (!http_upload_transport::is_available()) {
        GTEST_SKIP() << "HTTP backend not compiled in";
    }

    auto executor = std::make_shared<held_executor>();
    std::atomic<int> completions{0};
    std::optional<error_code> last_code;
    cancellation_token token;
    {
        http_upload_transport transport(transport_config{}, executor);
        transport.send(make_request(), token, nullptr,
            [&completions, &last_code](result<transport_response> r) {
                ++completions;
                if (!r) {
                    last_code = r.error().code;
                }
            });
        token.cancel();
    }

    ASSERT_EQ(executor->jobs.size(), 1u);
    executor->jobs.front()();

    EXPECT_EQ(completions.load(), 1);
    ASSERT_TRUE(last_code.has_value());
    EXPECT_EQ(*last_code, error_code::transfer_cancelled);
}

TEST_F(HttpUploadTransportTest, QueuedRequestAfterDestructionReportsCancellation) {
    if (!http_upload_transport::is_available()) {
        GTEST_SKIP() << "HTTP backend not compiled in";
    }

    auto executor = std::make_shared<held_executor>();
    std::optional<result<transport_response>> outcome;
    {
        http_upload_transport transport(transport_config{}, executor);
        transport.send(make_request(), cancellation_token{}, nullptr,
            [&outcome](result<transport_response> r) { outcome = std::move(r); });
    }

    ASSERT_EQ(executor->jobs.size(), 1u);
    EXPECT_FALSE(outcome.has_value());
    executor->jobs.front()();

    ASSERT_TRUE(outcome.has_value());
    ASSERT_FALSE(outcome->has_value());
    EXPECT_EQ(outcome->error().code, error_code::transfer_cancelled);
}

}  // namespace kcenon::resumable_upload::test
