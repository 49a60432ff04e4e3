#pragma once

#include <snapfetch/cli/progress_indicator.h>
#include <snapfetch/config/fetch_config.h>
#include <snapfetch/downloader/downloader.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snapfetch::cli {

struct ArtifactResult {
    std::string name;
    std::vector<std::string> urls;
    std::filesystem::path path;
    std::optional<Error> error;
    bool sha256Verified{false};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * One Acquirer plus terminal progress, shared by the get and run commands.
 */
class FetchSession {
public:
    FetchSession(const config::FetchConfig& cfg, bool showProgress,
                 downloader::ShouldCancel shouldCancel);

    // renameTo (optional) gives the artifact a name other than the URL's last segment
    ArtifactResult fetchSingle(const std::string& name, const std::string& url,
                               const std::filesystem::path& dir, const std::string& renameTo = {});

    ArtifactResult fetchMultipart(const std::string& name, const std::vector<std::string>& urls,
                                  const std::filesystem::path& dir, const std::string& finalName);

    // Sets result.error to HashMismatch (or the I/O error) when verification fails
    void verify(ArtifactResult& result, const std::string& expectedSha256);

private:
    void onProgress(const downloader::ProgressEvent& ev);
    void show(const std::string& message);

    config::FetchConfig cfg_;
    downloader::Acquirer acquirer_;
    downloader::ShouldCancel shouldCancel_;
    std::unique_ptr<ProgressIndicator> progress_;
    std::string lastMessage_;
};

void printHuman(const ArtifactResult& result, std::ostream& out);

} // namespace snapfetch::cli
