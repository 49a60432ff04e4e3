#include <catch2/catch_test_macros.hpp>

#include <snapfetch/crypto/hasher.h>
#include <snapfetch/downloader/downloader.hpp>

#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <algorithm>
#include <cctype>
#include <string>

using namespace snapfetch;
using namespace snapfetch::crypto;
using snapfetch::test_support::TempDirScope;

namespace {
constexpr const char* kAbcHash =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* kEmptyHash =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
} // namespace

TEST_CASE("SHA256Hasher: known vectors", "[crypto][sha256]") {
    CHECK(SHA256Hasher::hash(std::string_view("abc")) == kAbcHash);
    CHECK(SHA256Hasher::hash(std::string_view()) == kEmptyHash);
}

TEST_CASE("SHA256Hasher: incremental updates match one-shot", "[crypto][sha256]") {
    auto hasher = createSHA256Hasher();
    const std::string text = "abc";
    for (char c : text) {
        hasher->update(std::as_bytes(std::span<const char>(&c, 1)));
    }
    CHECK(hasher->finalize() == kAbcHash);
    // finalize() resets the state
    CHECK(hasher->finalize() == kEmptyHash);
}

TEST_CASE("SHA256Hasher: hashFile", "[crypto][sha256]") {
    auto tmp = TempDirScope::unique_under("snapfetch-sha256");
    const auto payload = test::make_payload(200 * 1024);
    const auto file = test::write_file(tmp.path() / "blob.bin", payload);

    SHA256Hasher hasher;
    std::uint64_t lastProcessed = 0;
    std::uint64_t reportedTotal = 0;
    hasher.setProgressCallback([&](std::uint64_t processed, std::uint64_t total) {
        lastProcessed = processed;
        reportedTotal = total;
    });

    auto r = hasher.hashFile(file);
    REQUIRE(r);
    CHECK(r.value() == SHA256Hasher::hash(std::string_view(payload)));
    CHECK(lastProcessed == payload.size());
    CHECK(reportedTotal == payload.size());

    auto missing = hasher.hashFile(tmp.path() / "missing.bin");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::IoError);
}

TEST_CASE("verifySha256", "[crypto][sha256][verify]") {
    auto tmp = TempDirScope::unique_under("snapfetch-verify");
    const auto file = test::write_file(tmp.path() / "abc.txt", "abc");

    SECTION("match") { CHECK(downloader::verifySha256(file, kAbcHash)); }

    SECTION("upper-case expected hash") {
        std::string upper = kAbcHash;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        CHECK(downloader::verifySha256(file, upper));
    }

    SECTION("mismatch") {
        auto r = downloader::verifySha256(file, kEmptyHash);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::HashMismatch);
    }

    SECTION("malformed expected hash") {
        auto r = downloader::verifySha256(file, "abc123");
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);

        std::string notHex(64, 'g');
        auto r2 = downloader::verifySha256(file, notHex);
        REQUIRE_FALSE(r2);
        CHECK(r2.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("missing file") {
        auto r = downloader::verifySha256(tmp.path() / "nope", kAbcHash);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::IoError);
    }
}
