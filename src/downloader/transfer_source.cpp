/*
 * snapfetch/src/downloader/transfer_source.cpp
 *
 * Scheme dispatch and the URL / header helpers shared by both sources.
 */

#include <snapfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <string>
#include <string_view>

namespace snapfetch::downloader {

namespace {

constexpr std::string_view kS3Scheme = "s3://";

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

} // namespace

bool isS3Url(std::string_view url) noexcept {
    return url.substr(0, kS3Scheme.size()) == kS3Scheme;
}

Result<S3Location> parseS3Url(std::string_view url) {
    if (!isS3Url(url)) {
        return Error{ErrorCode::InvalidArgument, "Invalid S3 URL format: " + std::string(url)};
    }
    auto rest = url.substr(kS3Scheme.size());
    auto slash = rest.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 >= rest.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid S3 URL format. Expected s3://bucket/key, got: " + std::string(url)};
    }
    S3Location loc;
    loc.bucket = std::string(rest.substr(0, slash));
    loc.key = std::string(rest.substr(slash + 1));
    return loc;
}

Result<std::string> fileNameFromUrl(std::string_view url) {
    auto cut = url.find_first_of("?#");
    auto path = url.substr(0, cut);

    // Ignore the authority part so "https://host" does not yield "host"
    if (auto scheme = path.find("://"); scheme != std::string_view::npos) {
        auto afterAuthority = path.find('/', scheme + 3);
        path = afterAuthority == std::string_view::npos ? std::string_view{}
                                                        : path.substr(afterAuthority);
    }

    auto slash = path.rfind('/');
    auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return Error{ErrorCode::InvalidArgument,
                     "Failed to determine filename from URL: " + std::string(url)};
    }
    return std::string(name);
}

std::optional<std::uint64_t> parseContentRangeTotal(std::string_view value) {
    // "bytes 0-0/12345"
    auto v = trimView(value);
    auto slash = v.rfind('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    auto total = trimView(v.substr(slash + 1));
    if (total.empty() || total == "*")
        return std::nullopt;

    std::uint64_t out{0};
    auto res = std::from_chars(total.data(), total.data() + total.size(), out);
    if (res.ec != std::errc() || res.ptr != total.data() + total.size())
        return std::nullopt;
    return out;
}

Result<std::unique_ptr<ITransferSource>> makeTransferSource(std::string_view url,
                                                            const SourceOptions& options) {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty URL"};
    }
    if (isS3Url(url)) {
        auto loc = parseS3Url(url);
        if (!loc) {
            return loc.error();
        }
        spdlog::debug("Using object-storage source for bucket={} key={}", loc.value().bucket,
                      loc.value().key);
        return makeS3ObjectSource(options);
    }
    spdlog::debug("Using HTTP range source for {}", url);
    return makeHttpRangeSource(options.http);
}

} // namespace snapfetch::downloader
