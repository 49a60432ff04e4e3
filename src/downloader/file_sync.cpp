#include "file_sync.h"

#include <fcntl.h>
#include <unistd.h>

#include <system_error>

namespace snapfetch::downloader::detail {

namespace fs = std::filesystem;

Result<void> fsyncFile(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
#if defined(__APPLE__)
    // On macOS, F_FULLFSYNC is stricter than fsync; do both, tolerating failures.
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
#endif
    ::close(fd);
    return Result<void>();
}

Result<void> fsyncDir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
#if defined(__APPLE__)
    (void)::fsync(fd);
    (void)fcntl(fd, F_FULLFSYNC);
#else
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
#endif
    ::close(fd);
    return Result<void>();
}

std::uint64_t localFileSize(const fs::path& p) noexcept {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        return 0;
    }
    auto sz = fs::file_size(p, ec);
    return ec ? 0 : static_cast<std::uint64_t>(sz);
}

} // namespace snapfetch::downloader::detail
