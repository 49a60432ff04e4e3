#include <catch2/catch_test_macros.hpp>

#include <snapfetch/downloader/downloader.hpp>

#include <atomic>
#include <chrono>
#include <limits>

using namespace snapfetch;
using namespace snapfetch::downloader;
using namespace std::chrono_literals;

TEST_CASE("RetryPolicy: exponential backoff", "[downloader][retry]") {
    RetryPolicy policy; // 1s initial, x2, 300s cap

    SECTION("Defaults") {
        CHECK(policy.maxRetries == 5);
        CHECK(policy.initialDelay == 1000ms);
        CHECK(policy.maxDelay == 300000ms);
        CHECK(policy.backoffMultiplier == 2.0);
    }

    SECTION("Doubles per attempt") {
        CHECK(policy.delayFor(0) == 1000ms);
        CHECK(policy.delayFor(1) == 2000ms);
        CHECK(policy.delayFor(3) == 8000ms);
        CHECK(policy.delayFor(8) == 256000ms);
    }

    SECTION("Clamped at maxDelay") {
        CHECK(policy.delayFor(9) == 300000ms);
        CHECK(policy.delayFor(64) == 300000ms);
        CHECK(policy.delayFor(std::numeric_limits<std::uint32_t>::max()) == 300000ms);
    }

    SECTION("Fractional multiplier floors to whole milliseconds") {
        policy.initialDelay = 1000ms;
        policy.backoffMultiplier = 1.5;
        CHECK(policy.delayFor(1) == 1500ms);
        CHECK(policy.delayFor(2) == 2250ms);
        CHECK(policy.delayFor(3) == 3375ms);
        CHECK(policy.delayFor(4) == 5062ms);
    }

    SECTION("Zero initial delay never sleeps") {
        policy.initialDelay = 0ms;
        CHECK(policy.delayFor(0) == 0ms);
        CHECK(policy.delayFor(10) == 0ms);
    }
}

TEST_CASE("RetryPolicy: shouldRetry bounds", "[downloader][retry]") {
    RetryPolicy policy;
    policy.maxRetries = 2;
    CHECK(policy.shouldRetry(0));
    CHECK(policy.shouldRetry(1));
    CHECK_FALSE(policy.shouldRetry(2));

    policy.maxRetries = 0;
    CHECK_FALSE(policy.shouldRetry(0));
}

TEST_CASE("isRetryable: error classification", "[downloader][retry]") {
    CHECK(isRetryable(Error{ErrorCode::NetworkError, "reset"}));
    CHECK(isRetryable(Error{ErrorCode::Timeout, "slow"}));
    CHECK(isRetryable(Error{ErrorCode::ServerError, "HTTP 503"}));
    CHECK(isRetryable(Error{ErrorCode::ServerError, "HTTP 403"}));
    CHECK(isRetryable(Error{ErrorCode::IoError, "disk"}));

    CHECK_FALSE(isRetryable(Error{ErrorCode::NotFound, "HTTP 404"}));
    CHECK_FALSE(isRetryable(Error{ErrorCode::InvalidArgument, "bad url"}));
    CHECK_FALSE(isRetryable(Error{ErrorCode::OperationCancelled, "stop"}));
    CHECK_FALSE(isRetryable(Error{ErrorCode::HashMismatch, "sha"}));
}

TEST_CASE("cooperativeSleep: honours cancellation", "[downloader][retry]") {
    SECTION("Returns promptly once cancelled") {
        std::atomic<int> polls{0};
        const auto start = std::chrono::steady_clock::now();
        cooperativeSleep(10s, [&]() { return ++polls >= 2; });
        const auto elapsed = std::chrono::steady_clock::now() - start;
        CHECK(elapsed < 2s);
        CHECK(polls.load() >= 2);
    }

    SECTION("Sleeps roughly the requested time without a predicate") {
        const auto start = std::chrono::steady_clock::now();
        cooperativeSleep(60ms, {});
        CHECK(std::chrono::steady_clock::now() - start >= 60ms);
    }
}

TEST_CASE("State and stage names", "[downloader]") {
    CHECK(std::string(toString(AcquireState::AlreadyComplete)) == "already-complete");
    CHECK(std::string(toString(AcquireState::Resuming)) == "resuming");
    CHECK(std::string(toString(ProgressStage::Concatenating)) == "concatenating");
}
