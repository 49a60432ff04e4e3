#pragma once

#include <snapfetch/core/types.h>
#include <snapfetch/downloader/downloader.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace snapfetch::config {

/**
 * The artifacts `snapfetch run` acquires. Empty URLs are skipped.
 */
struct ArtifactSet {
    std::string binaryUrl;
    std::string snapshotUrl;
    std::vector<std::string> snapshotUrls; // multipart, takes precedence over snapshotUrl
    std::string snapshotFilename;          // required with snapshotUrls
    std::string addrbookUrl;
    std::string snapshotSha256;

    // Effective snapshot URL list (multipart list, else the single URL, else empty)
    [[nodiscard]] std::vector<std::string> snapshotUrlList() const;
    [[nodiscard]] bool isMultipartSnapshot() const noexcept { return !snapshotUrls.empty(); }
};

struct FetchConfig {
    std::filesystem::path downloadDir;
    std::size_t chunkSizeBytes{downloader::kDefaultChunkSizeBytes};
    downloader::RetryPolicy retry{};
    downloader::SourceOptions source{};
    ArtifactSet artifacts{};
    std::filesystem::path loadedFrom; // empty when no file was read
};

// ~/.snapfetch/downloads
std::filesystem::path default_download_dir();

// Built-in defaults, before any file or environment override
FetchConfig defaultFetchConfig();

/**
 * Apply "section.key" values on top of base. Malformed values and inconsistent
 * settings are ErrorCode::InvalidArgument.
 */
Result<FetchConfig> applyConfigValues(const std::map<std::string, std::string>& values,
                                      FetchConfig base);

/**
 * Resolve and load the configuration:
 * explicitPath > SNAPFETCH_CONFIG > $XDG_CONFIG_HOME/snapfetch/config.toml >
 * ~/.config/snapfetch/config.toml. A missing default file yields the defaults;
 * a missing explicit file is ErrorCode::NotFound. SNAPFETCH_DOWNLOAD_DIR
 * overrides download.dir.
 */
Result<FetchConfig> loadFetchConfig(const std::filesystem::path& explicitPath = {});

} // namespace snapfetch::config
