// In-memory ITransferSource for engine tests (no network)

#pragma once

#include <snapfetch/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snapfetch::test {

using namespace snapfetch::downloader;

struct FakeObject {
    std::string content;
    bool supportsRange{true};
    bool ignoreRange{false}; // answers ranged requests from byte 0 (HTTP 200)
    bool reportSize{true};   // probe reports the total
};

/**
 * State shared by every source the fake factory hands out, so tests can
 * inspect call counts across attempts.
 */
struct FakeRemote {
    std::map<std::string, FakeObject> objects;

    // Consumed one per probe() / openRangeStream() call, front first
    std::deque<Error> probeFailures;
    std::deque<Error> openFailures;
    // Consumed one per opened stream: the stream fails after this many bytes
    std::deque<std::size_t> streamCutoffs;
    // Returned from every probe when set
    std::optional<Error> persistentProbeError;

    int probeCalls{0};
    int openCalls{0};
    int readCalls{0};
    int sourcesCreated{0};
    // Calls that arrived with a cancellation predicate attached
    int cancellableCalls{0};
    std::vector<std::uint64_t> requestedOffsets;
    std::vector<std::string> probedUrls;
};

class MemoryByteStream : public IByteStream {
public:
    MemoryByteStream(std::shared_ptr<FakeRemote> remote, std::string data,
                     std::optional<std::size_t> cutoff)
        : remote_(std::move(remote)), data_(std::move(data)), cutoff_(cutoff) {}

    Result<std::size_t> read(std::span<std::byte> buffer) override {
        ++remote_->readCalls;
        if (cutoff_ && pos_ >= *cutoff_) {
            return Error{ErrorCode::NetworkError, "connection reset by peer"};
        }
        std::size_t limit = data_.size();
        if (cutoff_)
            limit = std::min(limit, *cutoff_);
        const std::size_t n = std::min(buffer.size(), limit - pos_);
        if (n > 0) {
            std::memcpy(buffer.data(), data_.data() + pos_, n);
            pos_ += n;
        }
        return n;
    }

private:
    std::shared_ptr<FakeRemote> remote_;
    std::string data_;
    std::optional<std::size_t> cutoff_;
    std::size_t pos_{0};
};

class FakeTransferSource : public ITransferSource {
public:
    explicit FakeTransferSource(std::shared_ptr<FakeRemote> remote) : remote_(std::move(remote)) {}

    Result<RemoteObjectInfo> probe(std::string_view url,
                                   const ShouldCancel& shouldCancel) override {
        ++remote_->probeCalls;
        if (shouldCancel)
            ++remote_->cancellableCalls;
        remote_->probedUrls.emplace_back(url);
        if (!remote_->probeFailures.empty()) {
            auto err = remote_->probeFailures.front();
            remote_->probeFailures.pop_front();
            return err;
        }
        if (remote_->persistentProbeError) {
            return *remote_->persistentProbeError;
        }
        auto it = remote_->objects.find(std::string(url));
        if (it == remote_->objects.end()) {
            return Error{ErrorCode::NotFound, "HTTP 404 Not Found: " + std::string(url)};
        }
        RemoteObjectInfo info;
        info.totalSizeBytes = it->second.reportSize ? it->second.content.size() : 0;
        info.supportsRangeResume = it->second.supportsRange;
        return info;
    }

    Result<RangeStream> openRangeStream(std::string_view url, std::uint64_t startOffset,
                                        const ShouldCancel& shouldCancel) override {
        ++remote_->openCalls;
        if (shouldCancel)
            ++remote_->cancellableCalls;
        remote_->requestedOffsets.push_back(startOffset);
        if (!remote_->openFailures.empty()) {
            auto err = remote_->openFailures.front();
            remote_->openFailures.pop_front();
            return err;
        }
        auto it = remote_->objects.find(std::string(url));
        if (it == remote_->objects.end()) {
            return Error{ErrorCode::NotFound, "HTTP 404 Not Found: " + std::string(url)};
        }
        const auto& obj = it->second;

        std::optional<std::size_t> cutoff;
        if (!remote_->streamCutoffs.empty()) {
            cutoff = remote_->streamCutoffs.front();
            remote_->streamCutoffs.pop_front();
        }

        RangeStream out;
        if (startOffset > 0 && obj.ignoreRange) {
            out.startOffset = 0;
            out.body = std::make_unique<MemoryByteStream>(remote_, obj.content, cutoff);
            return out;
        }
        if (startOffset > 0 && startOffset >= obj.content.size()) {
            out.alreadyComplete = true;
            out.startOffset = startOffset;
            return out;
        }
        out.startOffset = startOffset;
        out.body = std::make_unique<MemoryByteStream>(
            remote_, obj.content.substr(static_cast<std::size_t>(startOffset)), cutoff);
        return out;
    }

    [[nodiscard]] std::string_view kind() const noexcept override { return "fake"; }

private:
    std::shared_ptr<FakeRemote> remote_;
};

inline SourceFactory makeFakeFactory(std::shared_ptr<FakeRemote> remote) {
    return [remote](std::string_view) -> Result<std::unique_ptr<ITransferSource>> {
        ++remote->sourcesCreated;
        return std::unique_ptr<ITransferSource>(std::make_unique<FakeTransferSource>(remote));
    };
}

/**
 * Sleeper that records requested delays instead of sleeping.
 */
struct RecordingSleeper {
    std::shared_ptr<std::vector<std::chrono::milliseconds>> delays =
        std::make_shared<std::vector<std::chrono::milliseconds>>();

    Sleeper sleeper() const {
        auto d = delays;
        return [d](std::chrono::milliseconds delay, const ShouldCancel&) { d->push_back(delay); };
    }
};

} // namespace snapfetch::test
