#pragma once

// Internal libcurl plumbing shared by HttpRangeSource and S3ObjectSource.

#include <snapfetch/downloader/downloader.hpp>

#include <curl/curl.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace snapfetch::downloader::detail {

struct CurlRequestSpec {
    std::string url;
    bool headOnly{false};
    std::vector<std::string> headers; // "Name: value"
    HttpOptions options{};
    ShouldCancel shouldCancel; // polled while the transfer runs
};

// Status and headers of the final response (redirect hops are discarded).
struct CurlResponseHead {
    long status{0};
    std::unordered_map<std::string, std::string> headers; // lower-case names

    [[nodiscard]] const std::string* find(std::string_view name) const;
};

void ensureCurlGlobalInit();

Error makeCurlError(CURLcode code, std::string_view where);

/**
 * Perform a request and stop as soon as the response body starts.
 * Used by probes: a server that ignores Range must not push the whole object.
 * Returns OperationCancelled when spec.shouldCancel fires mid-request.
 */
Result<CurlResponseHead> fetchResponseHead(const CurlRequestSpec& spec);

/**
 * Pull-based response body on top of a curl multi handle. open() drives the
 * transfer until the status line and headers are known; read() hands out
 * buffered body bytes, driving the transfer further when the buffer is empty.
 */
class CurlBodyStream final : public IByteStream {
public:
    static Result<std::unique_ptr<CurlBodyStream>> open(const CurlRequestSpec& spec);

    ~CurlBodyStream() override;
    CurlBodyStream(const CurlBodyStream&) = delete;
    CurlBodyStream& operator=(const CurlBodyStream&) = delete;

    Result<std::size_t> read(std::span<std::byte> buffer) override;

    [[nodiscard]] const CurlResponseHead& head() const noexcept { return head_; }

private:
    CurlBodyStream() = default;

    Result<void> pump();

    static size_t onWrite(char* ptr, size_t size, size_t nmemb, void* userdata);

    CURLM* multi_{nullptr};
    CURL* easy_{nullptr};
    curl_slist* headerList_{nullptr};

    ShouldCancel shouldCancel_;
    CurlResponseHead head_{};
    std::vector<std::byte> buffer_;
    std::size_t readPos_{0};
    bool done_{false};
    CURLcode result_{CURLE_OK};
};

} // namespace snapfetch::downloader::detail
