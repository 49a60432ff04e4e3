#include <snapfetch/crypto/hasher.h>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace snapfetch::crypto {

namespace {
constexpr size_t kHashBufferSize = 64 * 1024;
}

struct SHA256Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;
    ProgressCallback progressCallback;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

SHA256Hasher::SHA256Hasher() : pImpl(std::make_unique<Impl>()) {
    init();
}

SHA256Hasher::~SHA256Hasher() = default;

SHA256Hasher::SHA256Hasher(SHA256Hasher&&) noexcept = default;
SHA256Hasher& SHA256Hasher::operator=(SHA256Hasher&&) noexcept = default;

void SHA256Hasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
}

void SHA256Hasher::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }
}

std::string SHA256Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string result;
    result.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        result.push_back(kHex[(digest[i] >> 4) & 0xF]);
        result.push_back(kHex[digest[i] & 0xF]);
    }

    // Reset for reuse
    init();
    return result;
}

Result<std::string> SHA256Hasher::hashFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IoError, "Failed to open file for hashing: " + path.string()};
    }

    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to stat " + path.string() + ": " + ec.message()};
    }

    init();
    std::vector<std::byte> buffer(kHashBufferSize);
    std::uint64_t processed = 0;

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        auto bytesRead = file.gcount();
        if (bytesRead > 0) {
            update(std::span{buffer.data(), static_cast<size_t>(bytesRead)});
            processed += static_cast<std::uint64_t>(bytesRead);
            if (pImpl->progressCallback) {
                pImpl->progressCallback(processed, fileSize);
            }
        }
    }
    if (file.bad()) {
        spdlog::error("Read error while hashing {}", path.string());
        return Error{ErrorCode::IoError, "Read error while hashing " + path.string()};
    }

    return finalize();
}

void SHA256Hasher::setProgressCallback(ProgressCallback callback) {
    pImpl->progressCallback = std::move(callback);
}

std::string SHA256Hasher::hash(std::span<const std::byte> data) {
    SHA256Hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::string SHA256Hasher::hash(std::string_view text) {
    return hash(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

std::unique_ptr<IContentHasher> createSHA256Hasher() {
    return std::make_unique<SHA256Hasher>();
}

} // namespace snapfetch::crypto
