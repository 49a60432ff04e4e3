/*
 * snapfetch/src/downloader/retry_policy.cpp
 *
 * Backoff arithmetic, the retryable-error classification and the default
 * cooperative sleeper used between attempts.
 */

#include <snapfetch/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace snapfetch::downloader {

std::chrono::milliseconds RetryPolicy::delayFor(std::uint32_t attempt) const noexcept {
    const double base = static_cast<double>(initialDelay.count());
    const double scaled = std::floor(base * std::pow(backoffMultiplier, static_cast<double>(attempt)));
    const double cap = static_cast<double>(maxDelay.count());

    // NaN and infinity land here as well
    if (!(scaled < cap)) {
        return maxDelay;
    }
    if (scaled <= 0.0) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(scaled)};
}

bool isRetryable(const Error& error) noexcept {
    switch (error.code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::TlsVerificationFailed:
        case ErrorCode::ServerError:
        case ErrorCode::IoError:
        case ErrorCode::Unknown:
            return true;
        case ErrorCode::Success:
        case ErrorCode::InvalidArgument:
        case ErrorCode::NotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::HashMismatch:
        case ErrorCode::OperationCancelled:
        case ErrorCode::InternalError:
            return false;
    }
    return false;
}

void cooperativeSleep(std::chrono::milliseconds delay, const ShouldCancel& shouldCancel) {
    using clock = std::chrono::steady_clock;
    constexpr auto max_slice = std::chrono::milliseconds(50);

    const auto deadline = clock::now() + delay;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            return;
        }
        const auto now = clock::now();
        if (now >= deadline) {
            return;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining + std::chrono::milliseconds(1), max_slice));
    }
}

const char* toString(AcquireState state) noexcept {
    switch (state) {
        case AcquireState::Probing: return "probing";
        case AcquireState::AlreadyComplete: return "already-complete";
        case AcquireState::Resuming: return "resuming";
        case AcquireState::Starting: return "starting";
        case AcquireState::Streaming: return "streaming";
        case AcquireState::Done: return "done";
    }
    return "unknown";
}

const char* toString(ProgressStage stage) noexcept {
    switch (stage) {
        case ProgressStage::Probing: return "probing";
        case ProgressStage::Streaming: return "streaming";
        case ProgressStage::Complete: return "complete";
        case ProgressStage::Concatenating: return "concatenating";
    }
    return "unknown";
}

} // namespace snapfetch::downloader
