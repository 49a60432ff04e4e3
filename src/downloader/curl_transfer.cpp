/*
 * curl_transfer.cpp
 *
 * Notes
 * - fetchResponseHead() uses the easy API; the write callback aborts on the first
 *   body byte, which is reported by curl as CURLE_WRITE_ERROR and treated as success.
 * - CurlBodyStream drives a multi handle from read(), so the writer pulls bytes at
 *   its own pace instead of being called back from inside curl.
 * - Connect timeout plus low-speed limit replace an overall timeout: large objects
 *   legitimately take hours.
 * - Cancellation is polled from the xferinfo callback (probe) and between
 *   curl_multi_poll() rounds (body), so a stalled peer cannot delay it.
 */

#include "curl_transfer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>

namespace snapfetch::downloader::detail {

namespace {

constexpr int kPollTimeoutMs = 100;

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;

    auto* head = static_cast<CurlResponseHead*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    // A new status line starts a new response (redirect hop, 100 Continue)
    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        head->headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    head->headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    return total;
}

struct ProbeBodyContext {
    bool aborted{false};
    bool cancelled{false};
    const ShouldCancel* shouldCancel{nullptr};
};

size_t abort_on_body_cb(char*, size_t size, size_t nmemb, void* userdata) {
    if (size * nmemb == 0)
        return 0;
    static_cast<ProbeBodyContext*>(userdata)->aborted = true;
    return 0;
}

int probe_xferinfo_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<ProbeBodyContext*>(clientp);
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelled = true;
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

Error cancelledError(std::string_view url) {
    return Error{ErrorCode::OperationCancelled, "Transfer cancelled: " + std::string(url)};
}

curl_slist* build_header_list(const std::vector<std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        list = curl_slist_append(list, h.c_str());
    }
    return list;
}

void configure_common(CURL* curl, const HttpOptions& opts) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(opts.connectTimeout.count()));
    if (opts.lowSpeedLimitBps > 0 && opts.lowSpeedTime.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, opts.lowSpeedLimitBps);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(opts.lowSpeedTime.count()));
    }

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opts.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts.tls.insecure ? 0L : 2L);
    if (!opts.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, opts.tls.caPath.c_str());
    }

    // Proxy
    if (opts.proxy && !opts.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, opts.proxy->c_str());
    }

    if (!opts.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, opts.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

} // namespace

const std::string* CurlResponseHead::find(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? nullptr : &it->second;
}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (auto rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK) {
            spdlog::error("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

Result<CurlResponseHead> fetchResponseHead(const CurlRequestSpec& spec) {
    ensureCurlGlobalInit();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    curl_slist* list = build_header_list(spec.headers);
    CurlResponseHead head;
    ProbeBodyContext body;
    body.shouldCancel = &spec.shouldCancel;

    curl_easy_setopt(curl, CURLOPT_URL, spec.url.c_str());
    if (spec.headOnly) {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &head);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, abort_on_body_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    if (spec.shouldCancel) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, probe_xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &body);
    }
    configure_common(curl, spec.options);

    if (spec.shouldCancel && spec.shouldCancel()) {
        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);
        return cancelledError(spec.url);
    }
    CURLcode rc = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &head.status);

    if (list)
        curl_slist_free_all(list);
    curl_easy_cleanup(curl);

    if (body.cancelled) {
        spdlog::debug("probe {} cancelled", spec.url);
        return cancelledError(spec.url);
    }
    if (rc != CURLE_OK && !(rc == CURLE_WRITE_ERROR && body.aborted)) {
        return makeCurlError(rc, spec.headOnly ? "probe(HEAD)" : "probe(GET)");
    }
    spdlog::debug("probe {} -> HTTP {}", spec.url, head.status);
    return head;
}

Result<std::unique_ptr<CurlBodyStream>> CurlBodyStream::open(const CurlRequestSpec& spec) {
    ensureCurlGlobalInit();

    std::unique_ptr<CurlBodyStream> stream(new CurlBodyStream());
    stream->easy_ = curl_easy_init();
    stream->multi_ = curl_multi_init();
    if (!stream->easy_ || !stream->multi_) {
        return Error{ErrorCode::InternalError, "curl handle initialization failed"};
    }

    CURL* curl = stream->easy_;
    stream->shouldCancel_ = spec.shouldCancel;
    stream->headerList_ = build_header_list(spec.headers);

    curl_easy_setopt(curl, CURLOPT_URL, spec.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, stream->headerList_);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &stream->head_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlBodyStream::onWrite);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, stream.get());
    configure_common(curl, spec.options);

    if (auto mc = curl_multi_add_handle(stream->multi_, curl); mc != CURLM_OK) {
        return Error{ErrorCode::InternalError,
                     std::string("curl_multi_add_handle: ") + curl_multi_strerror(mc)};
    }

    // Run until the first body bytes arrive (headers are complete by then) or the
    // transfer ends.
    if (auto r = stream->pump(); !r) {
        return r.error();
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &stream->head_.status);

    if (stream->done_ && stream->result_ != CURLE_OK && stream->head_.status == 0) {
        return makeCurlError(stream->result_, "openRangeStream(GET)");
    }
    return stream;
}

CurlBodyStream::~CurlBodyStream() {
    if (multi_ && easy_) {
        curl_multi_remove_handle(multi_, easy_);
    }
    if (easy_)
        curl_easy_cleanup(easy_);
    if (multi_)
        curl_multi_cleanup(multi_);
    if (headerList_)
        curl_slist_free_all(headerList_);
}

size_t CurlBodyStream::onWrite(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* self = static_cast<CurlBodyStream*>(userdata);
    const auto* bytes = reinterpret_cast<const std::byte*>(ptr);
    self->buffer_.insert(self->buffer_.end(), bytes, bytes + total);
    return total;
}

Result<void> CurlBodyStream::pump() {
    while (!done_ && readPos_ >= buffer_.size()) {
        if (shouldCancel_ && shouldCancel_()) {
            char* url = nullptr;
            curl_easy_getinfo(easy_, CURLINFO_EFFECTIVE_URL, &url);
            return cancelledError(url != nullptr ? url : "");
        }
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            return Error{ErrorCode::NetworkError,
                         std::string("curl_multi_perform: ") + curl_multi_strerror(mc)};
        }

        if (running == 0) {
            int queued = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
                if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                    result_ = msg->data.result;
                }
            }
            done_ = true;
            break;
        }
        if (readPos_ < buffer_.size()) {
            break;
        }

        int numfds = 0;
        mc = curl_multi_poll(multi_, nullptr, 0, kPollTimeoutMs, &numfds);
        if (mc != CURLM_OK) {
            return Error{ErrorCode::NetworkError,
                         std::string("curl_multi_poll: ") + curl_multi_strerror(mc)};
        }
    }
    return Result<void>();
}

Result<std::size_t> CurlBodyStream::read(std::span<std::byte> out) {
    if (out.empty()) {
        return std::size_t{0};
    }
    if (readPos_ >= buffer_.size()) {
        buffer_.clear();
        readPos_ = 0;
        if (auto r = pump(); !r) {
            return r.error();
        }
    }

    if (readPos_ >= buffer_.size()) {
        // Drained and finished
        if (result_ != CURLE_OK) {
            return makeCurlError(result_, "read(body)");
        }
        return std::size_t{0};
    }

    const auto n = std::min(out.size(), buffer_.size() - readPos_);
    std::memcpy(out.data(), buffer_.data() + readPos_, n);
    readPos_ += n;
    return n;
}

} // namespace snapfetch::downloader::detail
