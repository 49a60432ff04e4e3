#include <catch2/catch_test_macros.hpp>

#include <snapfetch/downloader/downloader.hpp>

#include "../../common/test_helpers_catch2.h"
#include "../../support/local_http_server.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace snapfetch;
using namespace snapfetch::downloader;
using snapfetch::test_support::LocalHttpServer;
using snapfetch::test_support::TempDirScope;

namespace {

HttpOptions loopbackOptions() {
    HttpOptions opts;
    opts.connectTimeout = std::chrono::milliseconds(5000);
    opts.userAgent = "snapfetch-tests";
    return opts;
}

std::string drain(IByteStream& body) {
    std::string out;
    std::array<std::byte, 1000> buf{};
    while (true) {
        auto got = body.read(buf);
        REQUIRE(got);
        if (got.value() == 0)
            break;
        out.append(reinterpret_cast<const char*>(buf.data()), got.value());
    }
    return out;
}

void noSleep(std::chrono::milliseconds, const ShouldCancel&) {}

// Raises the flag from another thread after a delay
class DelayedCancel {
public:
    explicit DelayedCancel(std::chrono::milliseconds delay)
        : thread_([this, delay] {
              std::this_thread::sleep_for(delay);
              flag_ = true;
          }) {}
    ~DelayedCancel() { thread_.join(); }

    ShouldCancel predicate() {
        return [this] { return flag_.load(); };
    }

private:
    std::atomic<bool> flag_{false};
    std::thread thread_;
};

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

TEST_CASE("HttpRangeSource: probe", "[integration][http]") {
    LocalHttpServer server;
    const auto payload = test::make_payload(5000);
    server.put("/ranged.bin", {payload, true});
    server.put("/plain.bin", {payload, false});

    auto source = makeHttpRangeSource(loopbackOptions());

    SECTION("server with range support") {
        auto info = source->probe(server.url("/ranged.bin"), {});
        REQUIRE(info);
        CHECK(info.value().totalSizeBytes == 5000);
        CHECK(info.value().supportsRangeResume);
        REQUIRE_FALSE(server.requests().empty());
        CHECK(server.requests().back().range == "bytes=0-0");
    }
    SECTION("server without range support") {
        auto info = source->probe(server.url("/plain.bin"), {});
        REQUIRE(info);
        CHECK(info.value().totalSizeBytes == 5000);
        CHECK_FALSE(info.value().supportsRangeResume);
    }
    SECTION("missing object") {
        auto info = source->probe(server.url("/missing.bin"), {});
        REQUIRE_FALSE(info);
        CHECK(info.error().code == ErrorCode::NotFound);
        CHECK_FALSE(isRetryable(info.error()));
    }
}

TEST_CASE("HttpRangeSource: range streams", "[integration][http]") {
    LocalHttpServer server;
    const auto payload = test::make_payload(4096);
    server.put("/ranged.bin", {payload, true});
    LocalHttpServer::Resource ignoring{payload, true, true};
    server.put("/ignoring.bin", ignoring);

    auto source = makeHttpRangeSource(loopbackOptions());

    SECTION("full body from zero") {
        auto stream = source->openRangeStream(server.url("/ranged.bin"), 0, {});
        REQUIRE(stream);
        CHECK(stream.value().startOffset == 0);
        REQUIRE(stream.value().body);
        CHECK(drain(*stream.value().body) == payload);
        CHECK(server.requests().back().range.empty());
    }
    SECTION("resumed body") {
        auto stream = source->openRangeStream(server.url("/ranged.bin"), 1000, {});
        REQUIRE(stream);
        CHECK(stream.value().startOffset == 1000);
        CHECK(drain(*stream.value().body) == payload.substr(1000));
        CHECK(server.requests().back().range == "bytes=1000-");
    }
    SECTION("offset at the end is not satisfiable") {
        auto stream = source->openRangeStream(server.url("/ranged.bin"), 4096, {});
        REQUIRE(stream);
        CHECK(stream.value().alreadyComplete);
        CHECK_FALSE(stream.value().body);
    }
    SECTION("ignored range restarts from zero") {
        auto stream = source->openRangeStream(server.url("/ignoring.bin"), 1000, {});
        REQUIRE(stream);
        CHECK(stream.value().startOffset == 0);
        CHECK(drain(*stream.value().body) == payload);
    }
    SECTION("missing object") {
        auto stream = source->openRangeStream(server.url("/missing.bin"), 0, {});
        REQUIRE_FALSE(stream);
        CHECK(stream.error().code == ErrorCode::NotFound);
    }
}

TEST_CASE("HttpRangeSource: connection refused is retryable", "[integration][http]") {
    std::string url;
    {
        LocalHttpServer server;
        url = server.url("/gone.bin");
    }
    auto source = makeHttpRangeSource(loopbackOptions());
    auto info = source->probe(url, {});
    REQUIRE_FALSE(info);
    CHECK(info.error().code == ErrorCode::NetworkError);
    CHECK(isRetryable(info.error()));
}

TEST_CASE("HttpRangeSource: cancellation interrupts a stalled transfer",
          "[integration][http][cancel]") {
    LocalHttpServer server;
    LocalHttpServer::Resource stalledBody{test::make_payload(5000)};
    stalledBody.stallAfter = 10;
    server.put("/stalled.bin", stalledBody);
    LocalHttpServer::Resource silent{test::make_payload(100)};
    silent.stallBeforeHeaders = true;
    server.put("/silent.bin", silent);

    auto source = makeHttpRangeSource(loopbackOptions());

    SECTION("read on a stalled body") {
        std::atomic<bool> cancelled{false};
        auto stream = source->openRangeStream(server.url("/stalled.bin"), 0,
                                              [&cancelled] { return cancelled.load(); });
        REQUIRE(stream);
        REQUIRE(stream.value().body);
        auto& body = *stream.value().body;

        std::array<std::byte, 64> buf{};
        std::size_t received = 0;
        while (received < 10) {
            auto got = body.read(buf);
            REQUIRE(got);
            REQUIRE(got.value() > 0);
            received += got.value();
        }
        CHECK(received == 10);

        std::thread canceller([&cancelled] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            cancelled = true;
        });
        const auto start = Clock::now();
        auto stalled = body.read(buf);
        const auto elapsed = since(start);
        canceller.join();

        REQUIRE_FALSE(stalled);
        CHECK(stalled.error().code == ErrorCode::OperationCancelled);
        CHECK(elapsed < std::chrono::milliseconds(1000));
    }

    SECTION("size query on a server that never answers") {
        const auto start = Clock::now();
        Result<RemoteObjectInfo> info = [&] {
            DelayedCancel cancel(std::chrono::milliseconds(200));
            return source->probe(server.url("/silent.bin"), cancel.predicate());
        }();
        REQUIRE_FALSE(info);
        CHECK(info.error().code == ErrorCode::OperationCancelled);
        CHECK(since(start) < std::chrono::milliseconds(3000));
    }

    SECTION("size query cancelled up front sends nothing") {
        auto info = source->probe(server.url("/stalled.bin"), [] { return true; });
        REQUIRE_FALSE(info);
        CHECK(info.error().code == ErrorCode::OperationCancelled);
        CHECK(server.requests().empty());
    }
}

TEST_CASE("Acquirer over HTTP: cancellation during a stall keeps the partial file",
          "[integration][http][acquirer][cancel]") {
    auto tmp = TempDirScope::unique_under("snapfetch-http-cancel");
    LocalHttpServer server;
    LocalHttpServer::Resource res{test::make_payload(4096)};
    res.stallAfter = 10;
    server.put("/stall/object.bin", res);

    Acquirer acquirer(
        [](std::string_view url) {
            SourceOptions options;
            options.http = loopbackOptions();
            return makeTransferSource(url, options);
        },
        AcquirerOptions{64, false}, noSleep);

    const auto start = Clock::now();
    Result<fs::path> r = [&] {
        DelayedCancel cancel(std::chrono::milliseconds(300));
        TransferRequest request{server.url("/stall/object.bin"), tmp.path(), "object"};
        return acquirer.fetch(request, RetryPolicy{}, {}, cancel.predicate());
    }();

    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::OperationCancelled);
    CHECK(since(start) < std::chrono::milliseconds(2000));
    CHECK(fs::file_size(tmp.path() / "object.bin") == 10);
}

TEST_CASE("Acquirer over HTTP: dropped connection resumes", "[integration][http][acquirer]") {
    auto tmp = TempDirScope::unique_under("snapfetch-http-acquire");
    LocalHttpServer server;
    const auto payload = test::make_payload(20000);
    LocalHttpServer::Resource flaky{payload, true};
    flaky.dropAfter = 6000;
    flaky.dropTimes = 1;
    server.put("/snapshot.tar", flaky);

    SourceOptions options;
    options.http = loopbackOptions();
    Acquirer acquirer(
        [options](std::string_view url) { return makeTransferSource(url, options); },
        AcquirerOptions{4096, true}, noSleep);

    auto r = acquirer.fetch(TransferRequest{server.url("/snapshot.tar"), tmp.path(), "snapshot"},
                            RetryPolicy{});
    REQUIRE(r);
    CHECK(r.value() == tmp.path() / "snapshot.tar");
    CHECK(test::read_file(r.value()) == payload);

    const auto reqs = server.requests();
    CHECK(std::any_of(reqs.begin(), reqs.end(),
                      [](const auto& q) { return q.range == "bytes=6000-"; }));

    // A second run finds the file complete and only probes
    const auto before = server.requests().size();
    auto again =
        acquirer.fetch(TransferRequest{server.url("/snapshot.tar"), tmp.path(), "snapshot"},
                       RetryPolicy{});
    REQUIRE(again);
    CHECK(server.requests().size() == before + 1);
}

TEST_CASE("Acquirer over HTTP: empty object", "[integration][http][acquirer]") {
    auto tmp = TempDirScope::unique_under("snapfetch-http-empty");
    LocalHttpServer server;
    server.put("/empty.txt", {"", true});

    Acquirer acquirer(
        [](std::string_view url) { return makeTransferSource(url, SourceOptions{}); },
        AcquirerOptions{}, noSleep);
    auto r = acquirer.fetch(TransferRequest{server.url("/empty.txt"), tmp.path(), "empty"},
                            RetryPolicy{});
    REQUIRE(r);
    CHECK(fs::exists(r.value()));
    CHECK(fs::file_size(r.value()) == 0);
}

TEST_CASE("S3ObjectSource: path-style endpoint", "[integration][s3]") {
    auto tmp = TempDirScope::unique_under("snapfetch-s3");
    LocalHttpServer server;
    const auto payload = test::make_payload(3000);
    server.put("/bucket/snapshots/data%20file.bin", {payload, true});

    SourceOptions options;
    options.http = loopbackOptions();
    options.s3.endpoint = server.base() + "/";
    options.s3.region = "us-east-1";
    options.s3.accessKeyId = "AKIDEXAMPLE";
    options.s3.secretAccessKey = "secret";

    auto source = makeS3ObjectSource(options);
    CHECK(source->kind() == "s3");

    auto info = source->probe("s3://bucket/snapshots/data file.bin", {});
    REQUIRE(info);
    CHECK(info.value().totalSizeBytes == 3000);
    CHECK(info.value().supportsRangeResume);

    const auto probeReq = server.requests().back();
    CHECK(probeReq.method == "HEAD");
    CHECK(probeReq.authorization.rfind("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/", 0) == 0);

    auto stream = source->openRangeStream("s3://bucket/snapshots/data file.bin", 500, {});
    REQUIRE(stream);
    CHECK(stream.value().startOffset == 500);
    CHECK(drain(*stream.value().body) == payload.substr(500));
    CHECK(server.requests().back().range == "bytes=500-");

    auto missing = source->probe("s3://bucket/snapshots/none.bin", {});
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::NotFound);

    Acquirer acquirer(
        [options](std::string_view url) { return makeTransferSource(url, options); },
        AcquirerOptions{}, noSleep);
    auto r = acquirer.fetch(
        TransferRequest{"s3://bucket/snapshots/data file.bin", tmp.path(), "snapshot"},
        RetryPolicy{});
    REQUIRE(r);
    CHECK(r.value() == tmp.path() / "data file.bin");
    CHECK(test::read_file(r.value()) == payload);
}
