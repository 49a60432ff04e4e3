/*
 * http_range_source.cpp
 *
 * Notes
 * - probe() asks for a single byte; 206 carries the total in Content-Range.
 * - A 200 answer to a ranged GET means the server ignored Range; the stream is
 *   handed back with startOffset = 0 so the writer restarts the file.
 */

#include "curl_transfer.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <string>

namespace snapfetch::downloader {

namespace {

std::optional<std::uint64_t> parseUnsigned(const std::string* value) {
    if (value == nullptr || value->empty())
        return std::nullopt;
    std::uint64_t out{0};
    auto res = std::from_chars(value->data(), value->data() + value->size(), out);
    if (res.ec != std::errc() || res.ptr != value->data() + value->size())
        return std::nullopt;
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

Error statusError(long status, std::string_view url) {
    if (status == 404) {
        return Error{ErrorCode::NotFound, "HTTP 404 Not Found: " + std::string(url)};
    }
    return Error{ErrorCode::ServerError,
                 "HTTP error " + std::to_string(status) + ": " + std::string(url)};
}

class HttpRangeSource final : public ITransferSource {
public:
    explicit HttpRangeSource(HttpOptions options) : options_(std::move(options)) {}

    Result<RemoteObjectInfo> probe(std::string_view url,
                                   const ShouldCancel& shouldCancel) override {
        detail::CurlRequestSpec spec;
        spec.url = std::string(url);
        spec.headers.emplace_back("Range: bytes=0-0");
        spec.options = options_;
        spec.shouldCancel = shouldCancel;

        auto head = detail::fetchResponseHead(spec);
        if (!head) {
            return head.error();
        }
        const auto& h = head.value();
        RemoteObjectInfo info;
        if (h.status == 416) {
            // Not even byte 0 exists: an empty object ("bytes */0")
            info.supportsRangeResume = true;
            if (const auto* cr = h.find("content-range")) {
                info.totalSizeBytes = parseContentRangeTotal(*cr).value_or(0);
            }
            return info;
        }
        if (h.status >= 400) {
            return statusError(h.status, url);
        }

        if (h.status == 206) {
            info.supportsRangeResume = true;
            if (const auto* cr = h.find("content-range")) {
                info.totalSizeBytes = parseContentRangeTotal(*cr).value_or(0);
            }
        } else {
            info.totalSizeBytes = parseUnsigned(h.find("content-length")).value_or(0);
            if (const auto* ar = h.find("accept-ranges")) {
                info.supportsRangeResume = iequals(*ar, "bytes");
            }
        }
        spdlog::debug("HTTP probe {}: status={} total={} ranges={}", url, h.status,
                      info.totalSizeBytes, info.supportsRangeResume);
        return info;
    }

    Result<RangeStream> openRangeStream(std::string_view url, std::uint64_t startOffset,
                                        const ShouldCancel& shouldCancel) override {
        detail::CurlRequestSpec spec;
        spec.url = std::string(url);
        if (startOffset > 0) {
            spec.headers.push_back("Range: bytes=" + std::to_string(startOffset) + "-");
        }
        spec.options = options_;
        spec.shouldCancel = shouldCancel;

        auto opened = detail::CurlBodyStream::open(spec);
        if (!opened) {
            return opened.error();
        }
        auto body = std::move(opened).value();
        const long status = body->head().status;

        RangeStream out;
        if (status == 416) {
            spdlog::debug("HTTP {} -> 416, nothing left to fetch from offset {}", url, startOffset);
            out.alreadyComplete = true;
            out.startOffset = startOffset;
            return out;
        }
        if (status >= 400) {
            return statusError(status, url);
        }
        if (startOffset > 0 && status != 206) {
            spdlog::warn("Server ignored range request for {} (HTTP {}), restarting from 0", url,
                         status);
            out.startOffset = 0;
        } else {
            out.startOffset = startOffset;
        }
        out.body = std::move(body);
        return out;
    }

    [[nodiscard]] std::string_view kind() const noexcept override { return "http"; }

private:
    HttpOptions options_;
};

} // namespace

std::unique_ptr<ITransferSource> makeHttpRangeSource(const HttpOptions& options) {
    return std::make_unique<HttpRangeSource>(options);
}

} // namespace snapfetch::downloader
