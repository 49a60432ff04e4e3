/*
 * s3_object_source.cpp
 *
 * Notes
 * - s3://bucket/key is mapped onto an HTTPS endpoint and fetched with libcurl.
 * - Requests are SigV4-signed when credentials are available (options, then
 *   AWS_* environment); otherwise they go out unsigned for public buckets.
 * - probe() is a HEAD; objects always support ranged GETs.
 */

#include "curl_transfer.h"

#include <snapfetch/downloader/s3_signer.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <string>

namespace snapfetch::downloader {

namespace {

std::string envOrEmpty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

S3Credentials resolveCredentials(const S3Options& options) {
    S3Credentials creds{options.accessKeyId, options.secretAccessKey, options.sessionToken};
    if (!creds.complete()) {
        creds.accessKeyId = envOrEmpty("AWS_ACCESS_KEY_ID");
        creds.secretAccessKey = envOrEmpty("AWS_SECRET_ACCESS_KEY");
        creds.sessionToken = envOrEmpty("AWS_SESSION_TOKEN");
    }
    return creds;
}

Error statusError(long status, const S3Location& loc) {
    const auto target = "s3://" + loc.bucket + "/" + loc.key;
    if (status == 404) {
        return Error{ErrorCode::NotFound, "S3 object not found: " + target};
    }
    return Error{ErrorCode::ServerError,
                 "S3 request failed with HTTP " + std::to_string(status) + ": " + target};
}

class S3ObjectSource final : public ITransferSource {
public:
    explicit S3ObjectSource(SourceOptions options)
        : options_(std::move(options)), region_(resolveS3Region(options_.s3)),
          credentials_(resolveCredentials(options_.s3)) {
        if (!credentials_.complete()) {
            spdlog::debug("No S3 credentials configured; sending unsigned requests");
        }
    }

    Result<RemoteObjectInfo> probe(std::string_view url,
                                   const ShouldCancel& shouldCancel) override {
        auto spec = buildRequest(url, "HEAD", {});
        if (!spec) {
            return spec.error();
        }
        spec.value().headOnly = true;
        spec.value().shouldCancel = shouldCancel;

        auto head = detail::fetchResponseHead(spec.value());
        if (!head) {
            return head.error();
        }
        const auto& h = head.value();
        if (h.status >= 400) {
            return statusError(h.status, location_);
        }

        RemoteObjectInfo info;
        info.supportsRangeResume = true;
        if (const auto* cl = h.find("content-length")) {
            std::uint64_t total{0};
            auto res = std::from_chars(cl->data(), cl->data() + cl->size(), total);
            if (res.ec == std::errc()) {
                info.totalSizeBytes = total;
            }
        }
        spdlog::debug("S3 probe s3://{}/{}: status={} total={}", location_.bucket, location_.key,
                      h.status, info.totalSizeBytes);
        return info;
    }

    Result<RangeStream> openRangeStream(std::string_view url, std::uint64_t startOffset,
                                        const ShouldCancel& shouldCancel) override {
        S3Signer::HeaderList extra;
        if (startOffset > 0) {
            extra.emplace_back("Range", "bytes=" + std::to_string(startOffset) + "-");
        }
        auto spec = buildRequest(url, "GET", extra);
        if (!spec) {
            return spec.error();
        }
        spec.value().shouldCancel = shouldCancel;

        auto opened = detail::CurlBodyStream::open(spec.value());
        if (!opened) {
            return opened.error();
        }
        auto body = std::move(opened).value();
        const long status = body->head().status;

        RangeStream out;
        if (status == 416) {
            out.alreadyComplete = true;
            out.startOffset = startOffset;
            return out;
        }
        if (status >= 400) {
            return statusError(status, location_);
        }
        out.startOffset = (startOffset > 0 && status != 206) ? 0 : startOffset;
        out.body = std::move(body);
        return out;
    }

    [[nodiscard]] std::string_view kind() const noexcept override { return "s3"; }

private:
    Result<detail::CurlRequestSpec> buildRequest(std::string_view url, const std::string& method,
                                                 const S3Signer::HeaderList& extra) {
        auto loc = parseS3Url(url);
        if (!loc) {
            return loc.error();
        }
        location_ = std::move(loc).value();

        detail::CurlRequestSpec spec;
        spec.url = s3ObjectHttpUrl(location_, options_.s3, region_);
        spec.options = options_.http;

        if (credentials_.complete()) {
            auto signedHeaders =
                S3Signer::signRequest(credentials_, region_, method, spec.url, extra);
            if (!signedHeaders) {
                return signedHeaders.error();
            }
            spec.headers = std::move(signedHeaders).value();
        } else {
            for (const auto& [name, value] : extra) {
                spec.headers.push_back(name + ": " + value);
            }
        }
        return spec;
    }

    SourceOptions options_;
    std::string region_;
    S3Credentials credentials_;
    S3Location location_;
};

} // namespace

std::string resolveS3Region(const S3Options& options) {
    if (!options.region.empty())
        return options.region;
    if (auto r = envOrEmpty("AWS_REGION"); !r.empty())
        return r;
    if (auto r = envOrEmpty("AWS_DEFAULT_REGION"); !r.empty())
        return r;
    if (options.endpoint.find("r2.cloudflarestorage.com") != std::string::npos)
        return "auto"; // Cloudflare R2 default
    return "us-east-1";
}

std::string s3ObjectHttpUrl(const S3Location& location, const S3Options& options,
                            std::string_view region) {
    const auto key = S3Signer::encodeKey(location.key);
    if (!options.endpoint.empty()) {
        std::string base = options.endpoint;
        while (!base.empty() && base.back() == '/')
            base.pop_back();
        return base + "/" + location.bucket + "/" + key;
    }
    return "https://" + location.bucket + ".s3." + std::string(region) + ".amazonaws.com/" + key;
}

std::unique_ptr<ITransferSource> makeS3ObjectSource(const SourceOptions& options) {
    return std::make_unique<S3ObjectSource>(options);
}

} // namespace snapfetch::downloader
