#pragma once

#include <snapfetch/core/types.h>

#include <cstdint>
#include <filesystem>

namespace snapfetch::downloader::detail {

// Flush file contents / directory entries to stable storage.
Result<void> fsyncFile(const std::filesystem::path& p);
Result<void> fsyncDir(const std::filesystem::path& dir);

// Size of a regular file, 0 when it does not exist.
std::uint64_t localFileSize(const std::filesystem::path& p) noexcept;

} // namespace snapfetch::downloader::detail
