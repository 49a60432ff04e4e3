#pragma once

#include <snapfetch/core/types.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace snapfetch::crypto {

// Interface for streaming content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0; // lower-case hex

    virtual Result<std::string> hashFile(const std::filesystem::path& path) = 0;

    // (processed, total) after every buffer of hashFile()
    using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;
    virtual void setProgressCallback(ProgressCallback callback) = 0;
};

// SHA-256 implementation (OpenSSL EVP)
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher() override;

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    Result<std::string> hashFile(const std::filesystem::path& path) override;

    void setProgressCallback(ProgressCallback callback) override;

    // One-shot helpers
    static std::string hash(std::span<const std::byte> data);
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace snapfetch::crypto
