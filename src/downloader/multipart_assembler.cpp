/*
 * multipart_assembler.cpp
 *
 * Parts are fetched one after another through the Acquirer, concatenated in
 * order into a staging file that is renamed onto the final name, then deleted.
 * An existing final file short-circuits the whole assembly.
 */

#include <snapfetch/downloader/downloader.hpp>

#include "file_sync.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <memory>
#include <set>
#include <system_error>

namespace snapfetch::downloader {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferSize = 1 << 20; // 1 MiB

Result<void> appendFile(const fs::path& src, std::ofstream& os, const fs::path& dst) {
    std::ifstream is(src, std::ios::binary);
    if (!is.good()) {
        return Error{ErrorCode::IoError, "concatenate: failed to open part: " + src.string()};
    }
    auto buffer = std::make_unique<char[]>(kCopyBufferSize);
    while (is.good()) {
        is.read(buffer.get(), static_cast<std::streamsize>(kCopyBufferSize));
        std::streamsize got = is.gcount();
        if (got > 0) {
            os.write(buffer.get(), got);
            if (!os.good()) {
                return Error{ErrorCode::IoError,
                             "concatenate: write failed for destination: " + dst.string()};
            }
        }
    }
    if (!is.eof()) {
        return Error{ErrorCode::IoError, "concatenate: read failed for part: " + src.string()};
    }
    return Result<void>();
}

} // namespace

MultipartAssembler::MultipartAssembler(const Acquirer& acquirer) : acquirer_(acquirer) {}

Result<fs::path> MultipartAssembler::fetch(const std::vector<std::string>& urls,
                                           const fs::path& destinationDirectory,
                                           const std::string& finalFilename,
                                           const RetryPolicy& policy,
                                           const ProgressCallback& onProgress,
                                           const ShouldCancel& shouldCancel) const {
    if (urls.empty()) {
        return Error{ErrorCode::InvalidArgument, "Multipart download requires at least one URL"};
    }
    if (finalFilename.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Multipart download requires a final filename"};
    }

    const std::string stagingName = finalFilename + ".assembling";
    std::set<std::string> partNames;
    for (const auto& url : urls) {
        auto name = fileNameFromUrl(url);
        if (!name) {
            return name.error();
        }
        if (name.value() == finalFilename || name.value() == stagingName) {
            return Error{ErrorCode::InvalidArgument,
                         "Part filename collides with the final filename: " + name.value()};
        }
        if (!partNames.insert(name.value()).second) {
            return Error{ErrorCode::InvalidArgument,
                         "Two parts map to the same local filename: " + name.value()};
        }
    }

    const fs::path finalPath = destinationDirectory / finalFilename;
    std::error_code ec;
    if (fs::exists(finalPath, ec)) {
        spdlog::info("{} already exists, skipping multipart download", finalPath.string());
        return finalPath;
    }

    std::vector<fs::path> parts;
    parts.reserve(urls.size());
    for (std::size_t i = 0; i < urls.size(); ++i) {
        TransferRequest request{urls[i], destinationDirectory, fmt::format("part {}", i + 1)};
        spdlog::info("Downloading part {}/{}", i + 1, urls.size());
        auto part = acquirer_.fetch(request, policy, onProgress, shouldCancel);
        if (!part) {
            return part.error();
        }
        parts.push_back(std::move(part).value());
    }

    std::uint64_t totalBytes = 0;
    for (const auto& p : parts) {
        totalBytes += detail::localFileSize(p);
    }

    spdlog::info("Concatenating {} parts into {}", parts.size(), finalPath.string());
    const fs::path stagingPath = destinationDirectory / stagingName;
    {
        std::ofstream os(stagingPath, std::ios::binary | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::IoError,
                         "concatenate: failed to open destination: " + stagingPath.string()};
        }

        std::uint64_t position = 0;
        for (const auto& p : parts) {
            if (auto r = appendFile(p, os, stagingPath); !r) {
                os.close();
                fs::remove(stagingPath, ec);
                return r.error();
            }
            position += detail::localFileSize(p);
            if (onProgress) {
                ProgressEvent ev;
                ev.logicalName = finalFilename;
                ev.position = position;
                ev.total = totalBytes;
                ev.stage = ProgressStage::Concatenating;
                onProgress(ev);
            }
        }
        os.close();
        if (os.fail()) {
            fs::remove(stagingPath, ec);
            return Error{ErrorCode::IoError, "concatenate: failed to close " + stagingPath.string()};
        }
    }

    if (auto synced = detail::fsyncFile(stagingPath); !synced) {
        fs::remove(stagingPath, ec);
        return synced.error();
    }
    fs::rename(stagingPath, finalPath, ec);
    if (ec) {
        Error err{ErrorCode::IoError, "Failed to move " + stagingPath.string() + " to " +
                                          finalPath.string() + ": " + ec.message()};
        fs::remove(stagingPath, ec);
        return err;
    }
    if (auto synced = detail::fsyncDir(destinationDirectory); !synced) {
        spdlog::debug("fsync on {} failed (continuing): {}", destinationDirectory.string(),
                      synced.error().message);
    }

    for (const auto& p : parts) {
        std::error_code rmec;
        if (!fs::remove(p, rmec) || rmec) {
            spdlog::warn("Failed to remove part {}: {}", p.string(),
                         rmec ? rmec.message() : std::string("file not found"));
        }
    }

    spdlog::info("Multipart download complete: {} ({} bytes)", finalPath.string(), totalBytes);
    return finalPath;
}

} // namespace snapfetch::downloader
