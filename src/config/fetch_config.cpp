#include <snapfetch/config/config_helpers.h>
#include <snapfetch/config/fetch_config.h>
#include <snapfetch/version.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <set>
#include <system_error>

namespace snapfetch::config {

namespace fs = std::filesystem;

namespace {

const std::set<std::string>& knownKeys() {
    static const std::set<std::string> keys = {
        "download.dir",
        "download.chunk_size",
        "retry.max_retries",
        "retry.initial_delay_ms",
        "retry.max_delay_ms",
        "retry.backoff_multiplier",
        "http.connect_timeout_ms",
        "http.low_speed_limit_bps",
        "http.low_speed_time_s",
        "http.follow_redirects",
        "http.insecure",
        "http.ca_path",
        "http.proxy",
        "http.user_agent",
        "s3.region",
        "s3.endpoint",
        "s3.access_key_id",
        "s3.secret_access_key",
        "s3.session_token",
        "artifacts.binary_url",
        "artifacts.snapshot_url",
        "artifacts.snapshot_urls",
        "artifacts.snapshot_filename",
        "artifacts.addrbook_url",
        "artifacts.snapshot_sha256",
    };
    return keys;
}

Error badValue(const std::string& key, const std::string& value, std::string_view expected) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for " + key + ": '" + value + "' (expected " +
                     std::string(expected) + ")"};
}

Result<std::uint64_t> parseUnsigned(const std::string& key, const std::string& value) {
    std::uint64_t out{0};
    auto res = std::from_chars(value.data(), value.data() + value.size(), out);
    if (value.empty() || res.ec != std::errc() || res.ptr != value.data() + value.size()) {
        return badValue(key, value, "a non-negative integer");
    }
    return out;
}

Result<double> parseDouble(const std::string& key, const std::string& value) {
    if (value.empty()) {
        return badValue(key, value, "a number");
    }
    char* end = nullptr;
    const double out = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || !std::isfinite(out)) {
        return badValue(key, value, "a number");
    }
    return out;
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    return badValue(key, value, "true or false");
}

// Looks up key; returns false when absent
bool lookup(const std::map<std::string, std::string>& values, const std::string& key,
            std::string& out) {
    auto it = values.find(key);
    if (it == values.end())
        return false;
    out = it->second;
    return true;
}

Result<void> validate(const FetchConfig& cfg) {
    const auto& a = cfg.artifacts;
    if (!a.snapshotUrls.empty() && a.snapshotFilename.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "snapshot_filename is required when using snapshot_urls (multipart snapshots)"};
    }
    if (cfg.retry.backoffMultiplier < 1.0) {
        return Error{ErrorCode::InvalidArgument, "retry.backoff_multiplier must be >= 1.0"};
    }
    if (cfg.retry.maxDelay < cfg.retry.initialDelay) {
        return Error{ErrorCode::InvalidArgument,
                     "retry.max_delay_ms must not be smaller than retry.initial_delay_ms"};
    }
    if (cfg.chunkSizeBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "download.chunk_size must be positive"};
    }

    std::vector<std::string> urls = a.snapshotUrlList();
    urls.push_back(a.binaryUrl);
    urls.push_back(a.addrbookUrl);
    for (const auto& url : urls) {
        if (!url.empty() && downloader::isS3Url(url)) {
            if (auto loc = downloader::parseS3Url(url); !loc) {
                return loc.error();
            }
        }
    }
    return Result<void>();
}

} // namespace

std::vector<std::string> ArtifactSet::snapshotUrlList() const {
    if (!snapshotUrls.empty())
        return snapshotUrls;
    if (!snapshotUrl.empty())
        return {snapshotUrl};
    return {};
}

fs::path default_download_dir() {
    return expand_tilde("~/.snapfetch/downloads");
}

FetchConfig defaultFetchConfig() {
    FetchConfig cfg;
    cfg.downloadDir = default_download_dir();
    cfg.source.http.userAgent = SNAPFETCH_USER_AGENT;
    return cfg;
}

Result<FetchConfig> applyConfigValues(const std::map<std::string, std::string>& values,
                                      FetchConfig cfg) {
    for (const auto& [key, _] : values) {
        if (!knownKeys().count(key)) {
            spdlog::warn("Ignoring unknown config key '{}'", key);
        }
    }

    std::string v;

    // [download]
    if (lookup(values, "download.dir", v) && !v.empty())
        cfg.downloadDir = expand_tilde(v);
    if (lookup(values, "download.chunk_size", v)) {
        auto n = parseUnsigned("download.chunk_size", v);
        if (!n)
            return n.error();
        cfg.chunkSizeBytes = static_cast<std::size_t>(n.value());
    }

    // [retry]
    if (lookup(values, "retry.max_retries", v)) {
        auto n = parseUnsigned("retry.max_retries", v);
        if (!n)
            return n.error();
        if (n.value() > 1000)
            return badValue("retry.max_retries", v, "at most 1000");
        cfg.retry.maxRetries = static_cast<std::uint32_t>(n.value());
    }
    if (lookup(values, "retry.initial_delay_ms", v)) {
        auto n = parseUnsigned("retry.initial_delay_ms", v);
        if (!n)
            return n.error();
        cfg.retry.initialDelay = std::chrono::milliseconds(n.value());
    }
    if (lookup(values, "retry.max_delay_ms", v)) {
        auto n = parseUnsigned("retry.max_delay_ms", v);
        if (!n)
            return n.error();
        cfg.retry.maxDelay = std::chrono::milliseconds(n.value());
    }
    if (lookup(values, "retry.backoff_multiplier", v)) {
        auto d = parseDouble("retry.backoff_multiplier", v);
        if (!d)
            return d.error();
        cfg.retry.backoffMultiplier = d.value();
    }

    // [http]
    auto& http = cfg.source.http;
    if (lookup(values, "http.connect_timeout_ms", v)) {
        auto n = parseUnsigned("http.connect_timeout_ms", v);
        if (!n)
            return n.error();
        http.connectTimeout = std::chrono::milliseconds(n.value());
    }
    if (lookup(values, "http.low_speed_limit_bps", v)) {
        auto n = parseUnsigned("http.low_speed_limit_bps", v);
        if (!n)
            return n.error();
        http.lowSpeedLimitBps = static_cast<long>(n.value());
    }
    if (lookup(values, "http.low_speed_time_s", v)) {
        auto n = parseUnsigned("http.low_speed_time_s", v);
        if (!n)
            return n.error();
        http.lowSpeedTime = std::chrono::seconds(n.value());
    }
    if (lookup(values, "http.follow_redirects", v)) {
        auto b = parseBool("http.follow_redirects", v);
        if (!b)
            return b.error();
        http.followRedirects = b.value();
    }
    if (lookup(values, "http.insecure", v)) {
        auto b = parseBool("http.insecure", v);
        if (!b)
            return b.error();
        http.tls.insecure = b.value();
    }
    if (lookup(values, "http.ca_path", v))
        http.tls.caPath = expand_tilde(v).string();
    if (lookup(values, "http.proxy", v) && !v.empty())
        http.proxy = v;
    if (lookup(values, "http.user_agent", v) && !v.empty())
        http.userAgent = v;

    // [s3]
    auto& s3 = cfg.source.s3;
    lookup(values, "s3.region", s3.region);
    lookup(values, "s3.endpoint", s3.endpoint);
    lookup(values, "s3.access_key_id", s3.accessKeyId);
    lookup(values, "s3.secret_access_key", s3.secretAccessKey);
    lookup(values, "s3.session_token", s3.sessionToken);

    // [artifacts]
    auto& a = cfg.artifacts;
    lookup(values, "artifacts.binary_url", a.binaryUrl);
    lookup(values, "artifacts.snapshot_url", a.snapshotUrl);
    if (lookup(values, "artifacts.snapshot_urls", v))
        a.snapshotUrls = parse_string_list(v);
    lookup(values, "artifacts.snapshot_filename", a.snapshotFilename);
    lookup(values, "artifacts.addrbook_url", a.addrbookUrl);
    lookup(values, "artifacts.snapshot_sha256", a.snapshotSha256);

    if (auto ok = validate(cfg); !ok) {
        return ok.error();
    }
    return cfg;
}

Result<FetchConfig> loadFetchConfig(const fs::path& explicitPath) {
    fs::path path = explicitPath;
    bool required = !path.empty();
    if (path.empty()) {
        if (const char* env = std::getenv("SNAPFETCH_CONFIG"); env && *env) {
            path = expand_tilde(env);
            required = true;
        } else {
            path = get_config_path();
        }
    }

    auto cfg = defaultFetchConfig();
    std::error_code ec;
    if (fs::exists(path, ec)) {
        spdlog::debug("Loading configuration from {}", path.string());
        auto applied = applyConfigValues(parse_simple_toml_flat(path), std::move(cfg));
        if (!applied) {
            return Error{applied.error().code, path.string() + ": " + applied.error().message};
        }
        cfg = std::move(applied).value();
        cfg.loadedFrom = path;
    } else if (required) {
        return Error{ErrorCode::NotFound, "Config file not found: " + path.string()};
    } else {
        spdlog::debug("No configuration file at {}; using defaults", path.string());
    }

    if (const char* dir = std::getenv("SNAPFETCH_DOWNLOAD_DIR"); dir && *dir) {
        cfg.downloadDir = expand_tilde(dir);
    }
    return cfg;
}

} // namespace snapfetch::config
