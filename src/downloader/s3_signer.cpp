#include <snapfetch/downloader/s3_signer.h>

#include <snapfetch/crypto/hasher.h>

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <sstream>

namespace snapfetch::downloader {

namespace {

constexpr std::string_view kEmptyPayloadSha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

std::string hexEncode(const unsigned char* data, std::size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = hex[(data[i] >> 4) & 0xF];
        out[2 * i + 1] = hex[data[i] & 0xF];
    }
    return out;
}

struct ParsedUrl {
    std::string host;
    std::string path;  // begins with '/'
    std::string query; // without leading '?'
};

bool parseUrl(const std::string& url, ParsedUrl& pu) {
    auto pos = url.find("://");
    if (pos == std::string::npos)
        return false;
    auto rest = url.substr(pos + 3);
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        pu.host = rest;
        pu.path = "/";
    } else {
        pu.host = rest.substr(0, slash);
        auto pathQuery = rest.substr(slash);
        auto qpos = pathQuery.find('?');
        if (qpos == std::string::npos) {
            pu.path = pathQuery;
        } else {
            pu.path = pathQuery.substr(0, qpos);
            pu.query = pathQuery.substr(qpos + 1);
        }
    }
    return !pu.host.empty();
}

bool formatAmzDate(std::chrono::system_clock::time_point when, std::string& amzDate,
                   std::string& shortDate) {
    auto t = std::chrono::system_clock::to_time_t(when);
    std::tm gmt{};
    gmtime_r(&t, &gmt);
    char bufTs[32];
    char bufD[16];
    if (std::strftime(bufTs, sizeof(bufTs), "%Y%m%dT%H%M%SZ", &gmt) == 0 ||
        std::strftime(bufD, sizeof(bufD), "%Y%m%d", &gmt) == 0) {
        return false;
    }
    amzDate = bufTs;
    shortDate = bufD;
    return true;
}

std::array<unsigned char, 32> hmacSha256(std::string_view key, std::string_view data) {
    std::array<unsigned char, 32> out{};
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), (int)key.size(), (const unsigned char*)data.data(),
         data.size(), out.data(), &len);
    return out;
}

std::string_view asView(const std::array<unsigned char, 32>& a) {
    return std::string_view(reinterpret_cast<const char*>(a.data()), a.size());
}

std::string trimValue(const std::string& value) {
    auto start = value.find_first_not_of(" \t\r\n");
    auto end = value.find_last_not_of(" \t\r\n");
    return start == std::string::npos ? std::string() : value.substr(start, end - start + 1);
}

} // namespace

std::string S3Signer::encodeKey(std::string_view key) {
    static const char* unreserved =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_.~";
    std::string out;
    out.reserve(key.size());
    for (unsigned char c : key) {
        if ((c != 0 && std::strchr(unreserved, c)) || c == '/') {
            out.push_back((char)c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

Result<std::vector<std::string>>
S3Signer::signRequest(const S3Credentials& credentials, const std::string& region,
                      const std::string& method, const std::string& url,
                      const HeaderList& extraHeaders, std::chrono::system_clock::time_point now) {
    if (!credentials.complete()) {
        return Error{ErrorCode::PermissionDenied, "Missing S3 credentials"};
    }
    ParsedUrl pu;
    if (!parseUrl(url, pu)) {
        return Error{ErrorCode::InvalidArgument, "Cannot sign malformed URL: " + url};
    }

    const std::string service = "s3";
    const std::string payloadHex{kEmptyPayloadSha256};

    std::string amzDate;
    std::string ymd;
    if (!formatAmzDate(now, amzDate, ymd)) {
        return Error{ErrorCode::InternalError, "Failed to format request timestamp"};
    }

    // Headers (canonical set)
    HeaderList hdrs;
    hdrs.emplace_back("host", toLower(pu.host));
    hdrs.emplace_back("x-amz-content-sha256", payloadHex);
    hdrs.emplace_back("x-amz-date", amzDate);
    if (!credentials.sessionToken.empty())
        hdrs.emplace_back("x-amz-security-token", credentials.sessionToken);
    for (const auto& [name, value] : extraHeaders) {
        hdrs.emplace_back(toLower(name), trimValue(value));
    }
    std::sort(hdrs.begin(), hdrs.end(), [](auto& a, auto& b) { return a.first < b.first; });

    std::ostringstream canonicalHeaders;
    std::ostringstream signedHeaders;
    for (size_t i = 0; i < hdrs.size(); ++i) {
        canonicalHeaders << hdrs[i].first << ':' << hdrs[i].second << "\n";
        signedHeaders << hdrs[i].first;
        if (i + 1 < hdrs.size())
            signedHeaders << ';';
    }

    std::ostringstream cr;
    cr << method << "\n"
       << pu.path << "\n"
       << pu.query << "\n"
       << canonicalHeaders.str() << "\n"
       << signedHeaders.str() << "\n"
       << payloadHex;
    std::string canonicalRequestHash = crypto::SHA256Hasher::hash(std::string_view(cr.str()));

    // String to sign
    std::ostringstream sts;
    sts << "AWS4-HMAC-SHA256\n"
        << amzDate << "\n"
        << ymd << '/' << region << '/' << service << "/aws4_request\n"
        << canonicalRequestHash;

    // Derive signing key
    std::string kSecret = "AWS4" + credentials.secretAccessKey;
    auto kDate = hmacSha256(kSecret, ymd);
    auto kRegion = hmacSha256(asView(kDate), region);
    auto kService = hmacSha256(asView(kRegion), service);
    auto kSigning = hmacSha256(asView(kService), "aws4_request");
    auto sig = hmacSha256(asView(kSigning), sts.str());
    std::string signature = hexEncode(sig.data(), sig.size());

    std::ostringstream auth;
    auth << "Authorization: AWS4-HMAC-SHA256 Credential=" << credentials.accessKeyId << '/'
         << ymd << '/' << region << '/' << service
         << "/aws4_request, SignedHeaders=" << signedHeaders.str()
         << ", Signature=" << signature;

    // curl derives Host from the URL itself
    std::vector<std::string> lines;
    lines.push_back("x-amz-date: " + amzDate);
    lines.push_back("x-amz-content-sha256: " + payloadHex);
    if (!credentials.sessionToken.empty()) {
        lines.push_back("x-amz-security-token: " + credentials.sessionToken);
    }
    for (const auto& [name, value] : extraHeaders) {
        lines.push_back(name + ": " + value);
    }
    lines.push_back(auth.str());
    return lines;
}

} // namespace snapfetch::downloader
