#include <snapfetch/crypto/hasher.h>
#include <snapfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace snapfetch::downloader {

Result<void> verifySha256(const std::filesystem::path& path, std::string_view expectedHex) {
    std::string expected(expectedHex);
    std::transform(expected.begin(), expected.end(), expected.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (expected.size() != 64 ||
        !std::all_of(expected.begin(), expected.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        return Error{ErrorCode::InvalidArgument,
                     "Expected SHA-256 must be 64 hex characters, got: " + std::string(expectedHex)};
    }

    crypto::SHA256Hasher hasher;
    auto actual = hasher.hashFile(path);
    if (!actual) {
        return actual.error();
    }
    if (actual.value() != expected) {
        return Error{ErrorCode::HashMismatch, "SHA-256 mismatch for " + path.string() +
                                                  ": expected " + expected + ", got " +
                                                  actual.value()};
    }
    spdlog::debug("SHA-256 verified for {}", path.string());
    return Result<void>();
}

} // namespace snapfetch::downloader
