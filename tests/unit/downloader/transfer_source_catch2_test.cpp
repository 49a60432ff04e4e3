#include <catch2/catch_test_macros.hpp>

#include <snapfetch/downloader/downloader.hpp>

#include "../../common/test_helpers_catch2.h"

using namespace snapfetch;
using namespace snapfetch::downloader;

TEST_CASE("fileNameFromUrl: final path segment", "[downloader][url]") {
    SECTION("Plain HTTP URL") {
        auto r = fileNameFromUrl("https://example.com/snapshots/chain-1234.tar.lz4");
        REQUIRE(r);
        CHECK(r.value() == "chain-1234.tar.lz4");
    }

    SECTION("Query and fragment are stripped") {
        auto r = fileNameFromUrl("https://cdn.example.com/a/b/file.bin?token=abc&x=1#frag");
        REQUIRE(r);
        CHECK(r.value() == "file.bin");
    }

    SECTION("S3 URL") {
        auto r = fileNameFromUrl("s3://bucket/dir/sub/part.002");
        REQUIRE(r);
        CHECK(r.value() == "part.002");
    }

    SECTION("Empty segment is a configuration error") {
        auto trailing = fileNameFromUrl("https://example.com/dir/");
        REQUIRE_FALSE(trailing);
        CHECK(trailing.error().code == ErrorCode::InvalidArgument);

        auto hostOnly = fileNameFromUrl("https://example.com");
        REQUIRE_FALSE(hostOnly);
        CHECK(hostOnly.error().code == ErrorCode::InvalidArgument);

        CHECK_FALSE(fileNameFromUrl("https://example.com/a/.."));
        CHECK_FALSE(fileNameFromUrl(""));
    }
}

TEST_CASE("parseS3Url: bucket and key", "[downloader][s3][url]") {
    SECTION("Valid URL with nested key") {
        auto r = parseS3Url("s3://my-bucket/path/to/object.tar");
        REQUIRE(r);
        CHECK(r.value().bucket == "my-bucket");
        CHECK(r.value().key == "path/to/object.tar");
    }

    SECTION("Malformed URLs") {
        for (const char* bad : {"s3://", "s3://bucket", "s3://bucket/", "s3:///key",
                                "https://bucket/key"}) {
            INFO(bad);
            auto r = parseS3Url(bad);
            REQUIRE_FALSE(r);
            CHECK(r.error().code == ErrorCode::InvalidArgument);
        }
    }

    CHECK(isS3Url("s3://b/k"));
    CHECK_FALSE(isS3Url("https://b/k"));
}

TEST_CASE("parseContentRangeTotal", "[downloader][http][headers]") {
    CHECK(parseContentRangeTotal("bytes 0-0/12345") == std::optional<std::uint64_t>(12345));
    CHECK(parseContentRangeTotal("  bytes 100-199/200 ") == std::optional<std::uint64_t>(200));
    CHECK_FALSE(parseContentRangeTotal("bytes 0-0/*").has_value());
    CHECK_FALSE(parseContentRangeTotal("bytes 0-0").has_value());
    CHECK_FALSE(parseContentRangeTotal("bytes 0-0/12x").has_value());
}

TEST_CASE("makeTransferSource: selection by scheme", "[downloader][source]") {
    SourceOptions opts;

    SECTION("HTTP and HTTPS use the range source") {
        auto http = makeTransferSource("http://example.com/a.bin", opts);
        REQUIRE(http);
        CHECK(http.value()->kind() == "http");

        auto https = makeTransferSource("https://example.com/a.bin", opts);
        REQUIRE(https);
        CHECK(https.value()->kind() == "http");
    }

    SECTION("s3:// uses the object-storage source") {
        auto s3 = makeTransferSource("s3://bucket/key.bin", opts);
        REQUIRE(s3);
        CHECK(s3.value()->kind() == "s3");
    }

    SECTION("Malformed S3 URL fails before any network activity") {
        auto bad = makeTransferSource("s3://bucket-only", opts);
        REQUIRE_FALSE(bad);
        CHECK(bad.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Empty URL") {
        auto empty = makeTransferSource("", opts);
        REQUIRE_FALSE(empty);
        CHECK(empty.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("S3 addressing", "[downloader][s3]") {
    S3Location loc{"snapshots", "chain/v1/data file.tar"};

    SECTION("Virtual-hosted AWS URL with encoded key") {
        S3Options opts;
        CHECK(s3ObjectHttpUrl(loc, opts, "eu-west-1") ==
              "https://snapshots.s3.eu-west-1.amazonaws.com/chain/v1/data%20file.tar");
    }

    SECTION("Endpoint override uses path style") {
        S3Options opts;
        opts.endpoint = "http://127.0.0.1:9000/";
        CHECK(s3ObjectHttpUrl(loc, opts, "us-east-1") ==
              "http://127.0.0.1:9000/snapshots/chain/v1/data%20file.tar");
    }

    SECTION("Region resolution order") {
        S3Options opts;
        {
            test::ScopedEnvVar region("AWS_REGION", std::nullopt);
            test::ScopedEnvVar fallback("AWS_DEFAULT_REGION", std::nullopt);
            CHECK(resolveS3Region(opts) == "us-east-1");

            opts.endpoint = "https://acct.r2.cloudflarestorage.com";
            CHECK(resolveS3Region(opts) == "auto");
            opts.endpoint.clear();
        }
        {
            test::ScopedEnvVar region("AWS_REGION", std::nullopt);
            test::ScopedEnvVar fallback("AWS_DEFAULT_REGION", std::string("ap-south-1"));
            CHECK(resolveS3Region(opts) == "ap-south-1");
        }
        {
            test::ScopedEnvVar region("AWS_REGION", std::string("eu-central-1"));
            CHECK(resolveS3Region(opts) == "eu-central-1");
            opts.region = "us-west-2";
            CHECK(resolveS3Region(opts) == "us-west-2");
        }
    }
}
