#include <gtest/gtest.h>

#include <infra/error_handler/error.hpp>
#include <infra/interrupt.hpp>
#include <infra/retry.hpp>

using namespace segdl::infra;

TEST(ErrorTest, TransientCodesAreRetryable)
{
    EXPECT_TRUE(make_error(ErrorCode::SegmentTransient, "x").is_transient());
    EXPECT_TRUE(make_error(ErrorCode::RangeViolation, "x").is_transient());
    EXPECT_TRUE(make_error(ErrorCode::NetworkTimeout, "x").is_transient());
    EXPECT_TRUE(make_error(ErrorCode::HttpStatus, "x").is_transient());
    EXPECT_FALSE(make_error(ErrorCode::Corruption, "x").is_transient());
    EXPECT_FALSE(make_error(ErrorCode::Interrupted, "x").is_transient());
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::Corruption, "x").to_exit_code(), 22);
    EXPECT_EQ(make_error(ErrorCode::ChecksumMismatch, "x").to_exit_code(), 23);
    EXPECT_EQ(make_error(ErrorCode::RetryExhausted, "x").to_exit_code(), 24);
    EXPECT_EQ(make_error(ErrorCode::ProbeFailed, "x").to_exit_code(), 25);
    EXPECT_EQ(make_error(ErrorCode::Interrupted, "x").to_exit_code(), 130);
}

TEST(ErrorTest, CapturesSourceLocation)
{
    const auto err = make_error(ErrorCode::Unknown, "boom");
    EXPECT_EQ(err.message, "boom");
    EXPECT_GT(err.line, 0);
    EXPECT_NE(err.file.find("error_retry_test"), std::string::npos);
}

TEST(RetryPolicyTest, ExponentialDelay)
{
    RetryPolicy policy;
    EXPECT_EQ(policy.delay_for(0).count(), 1000);
    EXPECT_EQ(policy.delay_for(1).count(), 2000);
    EXPECT_EQ(policy.delay_for(2).count(), 4000);
}

TEST(RetryTest, RetriesTransientUntilSuccess)
{
    int calls = 0;
    auto res = with_retry([&](int) -> VoidResult {
        if (++calls < 3) {
            return std::unexpected(make_error(ErrorCode::SegmentTransient, "drop"));
        }
        return {};
    }, RetryPolicy{.max_attempts = 3, .initial_delay = std::chrono::milliseconds(1)});

    EXPECT_TRUE(res.has_value());
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, StopsAfterMaxAttempts)
{
    int calls = 0;
    auto res = with_retry([&](int) -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::SegmentTransient, "drop"));
    }, RetryPolicy{.max_attempts = 3, .initial_delay = std::chrono::milliseconds(1)});

    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::SegmentTransient);
    EXPECT_EQ(calls, 3);
}

TEST(RetryTest, FatalErrorIsNotRetried)
{
    int calls = 0;
    auto res = with_retry([&](int) -> VoidResult {
        ++calls;
        return std::unexpected(make_error(ErrorCode::Corruption, "bad"));
    }, RetryPolicy{.max_attempts = 5, .initial_delay = std::chrono::milliseconds(1)});

    EXPECT_FALSE(res.has_value());
    EXPECT_EQ(calls, 1);
}

TEST(RetryTest, CancellationInterruptsBackoff)
{
    CancellationToken cancel;
    int calls = 0;
    const auto started = std::chrono::steady_clock::now();
    auto res = with_retry([&](int) -> VoidResult {
        ++calls;
        cancel.request();
        return std::unexpected(make_error(ErrorCode::SegmentTransient, "drop"));
    }, RetryPolicy{.max_attempts = 5, .initial_delay = std::chrono::seconds(10)}, &cancel);

    EXPECT_FALSE(res.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

TEST(CancellationTokenTest, CopiesShareState)
{
    CancellationToken a;
    CancellationToken b = a;
    EXPECT_FALSE(b.requested());
    a.request();
    EXPECT_TRUE(b.requested());
    b.reset();
    EXPECT_FALSE(a.requested());
}

TEST(CancellationTokenTest, SleepReturnsEarlyWhenRequested)
{
    CancellationToken token;
    token.request();
    const auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.sleep_for(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
}

TEST(CancellationTokenTest, SignalSetsFlag)
{
    CancellationToken token;
    install_signal_handler(token);
    std::raise(SIGINT);
    EXPECT_TRUE(token.requested());
    remove_signal_handler();
}
