#pragma once

/*
 * snapfetch downloader - public types and engine interfaces (C++20)
 *
 * The acquisition engine is split into small pieces:
 * - RetryPolicy: pure backoff arithmetic
 * - ITransferSource / IByteStream: transport seam (HTTP range, S3 object storage)
 * - ResumableWriter: owns the local partial file for one attempt
 * - Acquirer: probe / resume / stream state machine wrapped in the retry loop
 * - MultipartAssembler: ordered part acquisition and byte-exact concatenation
 *
 * All operations report failures as snapfetch::Result values; nothing here throws
 * across the interface.
 */

#include <snapfetch/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace snapfetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

inline constexpr std::size_t kDefaultChunkSizeBytes = 256 * 1024; // 256 KiB

/**
 * Progress stages during a single acquisition.
 */
enum class ProgressStage { Probing, Streaming, Complete, Concatenating };

/**
 * States of one Acquirer attempt. Any failure sends the next attempt back to Probing.
 */
enum class AcquireState { Probing, AlreadyComplete, Resuming, Starting, Streaming, Done };

const char* toString(AcquireState state) noexcept;
const char* toString(ProgressStage stage) noexcept;

// ===================
// Small data objects
// ===================

/**
 * Retry/backoff policy.
 * delayFor(attempt) = min(maxDelay, floor(initialDelay * backoffMultiplier^attempt))
 */
struct RetryPolicy {
    std::uint32_t maxRetries{5};
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{300000};
    double backoffMultiplier{2.0};

    [[nodiscard]] std::chrono::milliseconds delayFor(std::uint32_t attempt) const noexcept;
    [[nodiscard]] bool shouldRetry(std::uint32_t attempt) const noexcept {
        return attempt < maxRetries;
    }
};

/**
 * One logical transfer. Immutable for the lifetime of a fetch.
 */
struct TransferRequest {
    std::string url;
    std::filesystem::path destinationDirectory;
    std::string logicalName; // "binary", "snapshot", "part 3", ...
};

/**
 * Result of a probe. totalSizeBytes == 0 means the size is unknown.
 */
struct RemoteObjectInfo {
    std::uint64_t totalSizeBytes{0};
    bool supportsRangeResume{false};
};

/**
 * Recomputed from disk at the start of every attempt.
 */
struct TransferState {
    std::uint64_t existingLocalBytes{0};
    std::uint32_t attemptNumber{0};
};

/**
 * Progress event for a single logical transfer. total == 0 means unknown.
 */
struct ProgressEvent {
    std::string logicalName;
    std::uint64_t position{0};
    std::uint64_t total{0};
    std::uint32_t attempt{0};
    ProgressStage stage{ProgressStage::Streaming};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Options shared by both curl-backed sources.
 */
struct HttpOptions {
    std::chrono::milliseconds connectTimeout{30000};
    // Abort an attempt when throughput stays under lowSpeedLimitBps for lowSpeedTime.
    long lowSpeedLimitBps{1024};
    std::chrono::seconds lowSpeedTime{60};
    bool followRedirects{true};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::string userAgent;
};

/**
 * Object storage addressing and credentials. Empty fields fall back to the
 * AWS_* environment variables.
 */
struct S3Options {
    std::string region;
    std::string endpoint; // e.g. "http://127.0.0.1:9000"; implies path-style addressing
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string sessionToken;
};

struct SourceOptions {
    HttpOptions http{};
    S3Options s3{};
};

/**
 * Bucket/key pair parsed from s3://bucket/key.
 */
struct S3Location {
    std::string bucket;
    std::string key;
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
using Sleeper = std::function<void(std::chrono::milliseconds, const ShouldCancel&)>;

// ==========================
// Service interface classes
// ==========================

/**
 * Lazily produced byte sequence. read() returns the number of bytes placed in
 * buffer; 0 means the stream is exhausted.
 */
class IByteStream {
public:
    virtual ~IByteStream() = default;
    virtual Result<std::size_t> read(std::span<std::byte> buffer) = 0;
};

/**
 * Outcome of openRangeStream().
 * - alreadyComplete: the source answered "range not satisfiable"; body is null.
 * - startOffset: offset the source actually honoured. 0 with a non-zero request
 *   means the range was ignored and the body starts at byte 0.
 */
struct RangeStream {
    std::unique_ptr<IByteStream> body;
    bool alreadyComplete{false};
    std::uint64_t startOffset{0};
};

/**
 * Transport seam: a remote object with a byte length and a range-readable body.
 * Implementations: HttpRangeSource (http/https) and S3ObjectSource (s3://).
 */
class ITransferSource {
public:
    virtual ~ITransferSource() = default;

    /**
     * Cheapest metadata query for size and resume capability.
     * Returns ErrorCode::NotFound for a missing object (permanent).
     * shouldCancel is polled while the request is in flight; a cancelled probe
     * returns ErrorCode::OperationCancelled.
     */
    virtual Result<RemoteObjectInfo> probe(std::string_view url,
                                           const ShouldCancel& shouldCancel) = 0;

    /**
     * Open a body stream starting at startOffset. The stream keeps a copy of
     * shouldCancel and polls it from read().
     */
    virtual Result<RangeStream> openRangeStream(std::string_view url, std::uint64_t startOffset,
                                                const ShouldCancel& shouldCancel) = 0;

    [[nodiscard]] virtual std::string_view kind() const noexcept = 0;
};

using SourceFactory =
    std::function<Result<std::unique_ptr<ITransferSource>>(std::string_view url)>;

// ==========================
// Engine components
// ==========================

/**
 * Streams an IByteStream into the local partial file.
 * Appends when existingBytes > 0, otherwise creates/truncates. The file handle
 * is flushed and closed before stream() returns on every path; on failure the
 * partial file stays on disk for the next attempt.
 */
class ResumableWriter {
public:
    explicit ResumableWriter(std::size_t chunkSizeBytes = kDefaultChunkSizeBytes);

    /**
     * Returns the final file size on success.
     */
    Result<std::uint64_t> stream(IByteStream& source, const std::filesystem::path& destination,
                                 std::uint64_t existingBytes, std::uint64_t totalBytes,
                                 const std::function<void(std::uint64_t, std::uint64_t)>& onChunk,
                                 const ShouldCancel& shouldCancel = {}) const;

    [[nodiscard]] std::size_t chunkSize() const noexcept { return chunkSize_; }

private:
    std::size_t chunkSize_;
};

struct AcquirerOptions {
    std::size_t chunkSizeBytes{kDefaultChunkSizeBytes};
    bool syncOnComplete{true}; // fsync the finished file
};

/**
 * Orchestrates probe -> resume/restart/complete -> stream for one logical
 * transfer, retried per RetryPolicy.
 */
class Acquirer {
public:
    explicit Acquirer(SourceFactory sourceFactory, AcquirerOptions options = {},
                      Sleeper sleeper = {});

    Result<std::filesystem::path> fetch(const TransferRequest& request, const RetryPolicy& policy,
                                        const ProgressCallback& onProgress = {},
                                        const ShouldCancel& shouldCancel = {}) const;

private:
    enum class AttemptOutcome { Completed, AlreadyComplete };

    Result<AttemptOutcome> runAttempt(ITransferSource& source, const TransferRequest& request,
                                      const std::filesystem::path& destination,
                                      const TransferState& state,
                                      const ProgressCallback& onProgress,
                                      const ShouldCancel& shouldCancel) const;

    SourceFactory sourceFactory_;
    AcquirerOptions options_;
    Sleeper sleeper_;
    ResumableWriter writer_;
};

/**
 * Downloads ordered parts through an Acquirer and concatenates them into one file.
 */
class MultipartAssembler {
public:
    explicit MultipartAssembler(const Acquirer& acquirer);

    Result<std::filesystem::path> fetch(const std::vector<std::string>& urls,
                                        const std::filesystem::path& destinationDirectory,
                                        const std::string& finalFilename,
                                        const RetryPolicy& policy,
                                        const ProgressCallback& onProgress = {},
                                        const ShouldCancel& shouldCancel = {}) const;

private:
    const Acquirer& acquirer_;
};

// ======================
// Free helpers
// ======================

/**
 * True for errors worth another attempt (network, server status, I/O).
 */
[[nodiscard]] bool isRetryable(const Error& error) noexcept;

[[nodiscard]] bool isS3Url(std::string_view url) noexcept;

/**
 * Parse s3://bucket/key. Malformed input is ErrorCode::InvalidArgument.
 */
Result<S3Location> parseS3Url(std::string_view url);

/**
 * Region for S3 requests: options, AWS_REGION, AWS_DEFAULT_REGION, then "us-east-1"
 * ("auto" for Cloudflare R2 endpoints).
 */
std::string resolveS3Region(const S3Options& options);

/**
 * HTTP(S) URL of an object: virtual-hosted AWS style, or path style under
 * options.endpoint when one is set. The key is URI-encoded.
 */
std::string s3ObjectHttpUrl(const S3Location& location, const S3Options& options,
                            std::string_view region);

/**
 * Local file name for a URL: final path segment with query and fragment stripped.
 */
Result<std::string> fileNameFromUrl(std::string_view url);

/**
 * Parse the total from "bytes <first>-<last>/<total>". "*" or garbage -> nullopt.
 */
std::optional<std::uint64_t> parseContentRangeTotal(std::string_view value);

/**
 * Select the transport by URL scheme: s3:// -> S3ObjectSource, else HttpRangeSource.
 * S3 URLs are validated here, before any network activity.
 */
Result<std::unique_ptr<ITransferSource>> makeTransferSource(std::string_view url,
                                                            const SourceOptions& options);

std::unique_ptr<ITransferSource> makeHttpRangeSource(const HttpOptions& options);
std::unique_ptr<ITransferSource> makeS3ObjectSource(const SourceOptions& options);

/**
 * Default sleeper: sleeps in short slices, returning early when shouldCancel fires.
 */
void cooperativeSleep(std::chrono::milliseconds delay, const ShouldCancel& shouldCancel);

/**
 * Streaming SHA-256 check of a finished artifact (hex compare is case-insensitive).
 */
Result<void> verifySha256(const std::filesystem::path& path, std::string_view expectedHex);

} // namespace snapfetch::downloader
