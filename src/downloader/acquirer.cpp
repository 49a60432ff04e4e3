/*
 * acquirer.cpp
 *
 * One logical transfer: probe -> (already complete | resume | restart) -> stream,
 * wrapped in the retry loop. Local state is re-read from disk at the start of
 * every attempt, so a failed attempt leaves nothing cached behind.
 */

#include <snapfetch/downloader/downloader.hpp>

#include "file_sync.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace snapfetch::downloader {

namespace fs = std::filesystem;

namespace {

Error annotate(const Error& cause, const std::string& label, std::uint32_t attempts) {
    return Error{cause.code, fmt::format("{}: {} (after {} attempt{})", label, cause.message,
                                         attempts, attempts == 1 ? "" : "s")};
}

} // namespace

Acquirer::Acquirer(SourceFactory sourceFactory, AcquirerOptions options, Sleeper sleeper)
    : sourceFactory_(std::move(sourceFactory)), options_(options), sleeper_(std::move(sleeper)),
      writer_(options.chunkSizeBytes) {}

Result<fs::path> Acquirer::fetch(const TransferRequest& request, const RetryPolicy& policy,
                                 const ProgressCallback& onProgress,
                                 const ShouldCancel& shouldCancel) const {
    auto fileName = fileNameFromUrl(request.url);
    if (!fileName) {
        return fileName.error();
    }
    if (request.destinationDirectory.empty()) {
        return Error{ErrorCode::InvalidArgument, "Destination directory is empty"};
    }
    if (!sourceFactory_) {
        return Error{ErrorCode::InternalError, "No transfer source factory configured"};
    }

    // Source selection validates the URL before any directory or network activity
    auto source = sourceFactory_(request.url);
    if (!source) {
        return source.error();
    }

    std::error_code ec;
    fs::create_directories(request.destinationDirectory, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create directory " +
                                             request.destinationDirectory.string() + ": " +
                                             ec.message()};
    }

    const fs::path destination = request.destinationDirectory / fileName.value();
    const std::string label = request.logicalName.empty() ? fileName.value() : request.logicalName;
    spdlog::debug("Fetching {} ({}) via {} source into {}", label, request.url,
                  source.value()->kind(), destination.string());

    Error lastError{ErrorCode::Unknown, "no attempt made"};
    for (std::uint32_t attempt = 0;; ++attempt) {
        if (shouldCancel && shouldCancel()) {
            return annotate(Error{ErrorCode::OperationCancelled, "Transfer cancelled"}, label,
                            attempt);
        }

        TransferState state;
        state.existingLocalBytes = detail::localFileSize(destination);
        state.attemptNumber = attempt;

        auto outcome =
            runAttempt(*source.value(), request, destination, state, onProgress, shouldCancel);
        if (outcome) {
            if (outcome.value() == AttemptOutcome::AlreadyComplete) {
                spdlog::info("{} already complete: {}", label, destination.string());
            } else {
                spdlog::info("{} downloaded to {}", label, destination.string());
            }
            return destination;
        }

        lastError = outcome.error();
        if (!isRetryable(lastError)) {
            spdlog::debug("{} failed: {}", label, lastError.message);
            return annotate(lastError, label, attempt + 1);
        }
        if (!policy.shouldRetry(attempt)) {
            spdlog::debug("{} failed after {} attempts: {}", label, attempt + 1, lastError.message);
            return annotate(lastError, label, attempt + 1);
        }

        const auto delay = policy.delayFor(attempt);
        spdlog::warn("{} attempt {}/{} failed: {}. Retrying in {} ms", label, attempt + 1,
                     policy.maxRetries + 1, lastError.message, delay.count());
        if (sleeper_) {
            sleeper_(delay, shouldCancel);
        } else {
            cooperativeSleep(delay, shouldCancel);
        }
    }
}

Result<Acquirer::AttemptOutcome>
Acquirer::runAttempt(ITransferSource& source, const TransferRequest& request,
                     const fs::path& destination, const TransferState& state,
                     const ProgressCallback& onProgress, const ShouldCancel& shouldCancel) const {
    const auto& label = request.logicalName;
    auto emit = [&](ProgressStage stage, std::uint64_t position, std::uint64_t total) {
        if (!onProgress)
            return;
        ProgressEvent ev;
        ev.logicalName = label;
        ev.position = position;
        ev.total = total;
        ev.attempt = state.attemptNumber;
        ev.stage = stage;
        onProgress(ev);
    };
    auto enter = [&](AcquireState s) {
        spdlog::debug("{} [attempt {}]: {}", label, state.attemptNumber + 1, toString(s));
    };

    enter(AcquireState::Probing);
    emit(ProgressStage::Probing, state.existingLocalBytes, 0);

    auto probed = source.probe(request.url, shouldCancel);
    if (!probed) {
        return probed.error();
    }
    const auto info = probed.value();
    const std::uint64_t total = info.totalSizeBytes;
    std::uint64_t offset = state.existingLocalBytes;

    if (total > 0 && offset == total) {
        enter(AcquireState::AlreadyComplete);
        emit(ProgressStage::Complete, total, total);
        return AttemptOutcome::AlreadyComplete;
    }

    if (offset > 0 && ((total > 0 && offset > total) || !info.supportsRangeResume)) {
        spdlog::warn("{}: local file has {} bytes but cannot be resumed (remote size {}, "
                     "range support {}); restarting",
                     label, offset, total, info.supportsRangeResume);
        offset = 0;
    }

    if (offset > 0) {
        enter(AcquireState::Resuming);
        spdlog::info("Resuming {} from byte {}", label, offset);
    } else {
        enter(AcquireState::Starting);
    }

    auto opened = source.openRangeStream(request.url, offset, shouldCancel);
    if (!opened) {
        return opened.error();
    }
    auto& range = opened.value();

    if (range.alreadyComplete) {
        enter(AcquireState::AlreadyComplete);
        if (!fs::exists(destination)) {
            // Range not satisfiable at offset 0: the object is empty
            std::ofstream touch(destination, std::ios::binary | std::ios::trunc);
            if (!touch) {
                return Error{ErrorCode::IoError, "Failed to create " + destination.string()};
            }
        }
        const auto have = detail::localFileSize(destination);
        emit(ProgressStage::Complete, have, total > 0 ? total : have);
        return AttemptOutcome::AlreadyComplete;
    }
    if (!range.body) {
        return Error{ErrorCode::InternalError, "Transfer source returned no body"};
    }
    if (range.startOffset != offset) {
        if (range.startOffset != 0) {
            return Error{ErrorCode::ServerError,
                         fmt::format("Server resumed at byte {} instead of {}", range.startOffset,
                                     offset)};
        }
        spdlog::warn("{}: server ignored the range request; restarting from byte 0", label);
        offset = 0;
        enter(AcquireState::Starting);
    }

    enter(AcquireState::Streaming);
    auto written = writer_.stream(
        *range.body, destination, offset, total,
        [&](std::uint64_t position, std::uint64_t t) {
            emit(ProgressStage::Streaming, position, t);
        },
        shouldCancel);
    if (!written) {
        return written.error();
    }
    const auto finalSize = written.value();
    if (total > 0 && finalSize != total) {
        return Error{ErrorCode::NetworkError,
                     fmt::format("Size mismatch: expected {} bytes, have {}", total, finalSize)};
    }

    if (options_.syncOnComplete) {
        if (auto synced = detail::fsyncFile(destination); !synced) {
            return synced.error();
        }
    }

    enter(AcquireState::Done);
    emit(ProgressStage::Complete, finalSize, total > 0 ? total : finalSize);
    return AttemptOutcome::Completed;
}

} // namespace snapfetch::downloader
