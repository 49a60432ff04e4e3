#pragma once

#include <snapfetch/core/types.h>

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace snapfetch::downloader {

struct S3Credentials {
    std::string accessKeyId;
    std::string secretAccessKey;
    std::string sessionToken;

    [[nodiscard]] bool complete() const noexcept {
        return !accessKeyId.empty() && !secretAccessKey.empty();
    }
};

class S3Signer {
public:
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    /**
     * Sign the request using AWS Signature Version 4
     * method: HTTP method ("GET", "HEAD")
     * url: full request URL (https://host/encoded/path[?query]); the path is used
     *      verbatim as the canonical URI, so it must already be URI-encoded
     * extraHeaders: additional headers to sign and send (e.g. Range)
     * Returns "Name: value" header lines to attach to the request, including
     * Authorization. The payload is always empty (GET/HEAD only).
     */
    static Result<std::vector<std::string>>
    signRequest(const S3Credentials& credentials, const std::string& region,
                const std::string& method, const std::string& url,
                const HeaderList& extraHeaders = {},
                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // URI-encode an object key for the request path ('/' kept)
    static std::string encodeKey(std::string_view key);
};

} // namespace snapfetch::downloader
