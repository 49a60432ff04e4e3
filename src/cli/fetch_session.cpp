#include "fetch_session.h"

#include <spdlog/spdlog.h>

#include <system_error>

namespace snapfetch::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

downloader::AcquirerOptions acquirerOptions(const config::FetchConfig& cfg) {
    downloader::AcquirerOptions opts;
    opts.chunkSizeBytes = cfg.chunkSizeBytes;
    return opts;
}

std::chrono::milliseconds since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 start);
}

} // namespace

json ArtifactResult::toJson() const {
    json j;
    j["name"] = name;
    j["urls"] = urls;
    j["success"] = ok();
    j["elapsed_ms"] = elapsed.count();
    if (ok()) {
        j["path"] = path.string();
        j["sha256_verified"] = sha256Verified;
    } else {
        j["error"] = {{"code", errorToString(error->code)}, {"message", error->message}};
    }
    return j;
}

FetchSession::FetchSession(const config::FetchConfig& cfg, bool showProgress,
                           downloader::ShouldCancel shouldCancel)
    : cfg_(cfg),
      acquirer_(
          [source = cfg.source](std::string_view url) {
              return downloader::makeTransferSource(url, source);
          },
          acquirerOptions(cfg)),
      shouldCancel_(std::move(shouldCancel)) {
    if (showProgress) {
        progress_ = std::make_unique<ProgressIndicator>(ProgressIndicator::Style::Bar);
        progress_->setCountAsBytes(true);
    }
}

void FetchSession::show(const std::string& message) {
    if (!progress_->isActive()) {
        progress_->start(message);
    } else if (message != lastMessage_) {
        progress_->setMessage(message);
    }
    lastMessage_ = message;
}

void FetchSession::onProgress(const downloader::ProgressEvent& ev) {
    if (!progress_)
        return;
    const std::string retry =
        ev.attempt > 0 ? " (attempt " + std::to_string(ev.attempt + 1) + ")" : std::string();
    switch (ev.stage) {
        case downloader::ProgressStage::Probing:
            show(ev.logicalName + ": probing" + retry);
            break;
        case downloader::ProgressStage::Streaming:
            show(ev.logicalName + retry);
            progress_->update(ev.position, ev.total);
            break;
        case downloader::ProgressStage::Concatenating:
            show("assembling " + ev.logicalName);
            progress_->update(ev.position, ev.total);
            break;
        case downloader::ProgressStage::Complete:
            progress_->stop();
            lastMessage_.clear();
            break;
    }
}

ArtifactResult FetchSession::fetchSingle(const std::string& name, const std::string& url,
                                         const fs::path& dir, const std::string& renameTo) {
    ArtifactResult result;
    result.name = name;
    result.urls = {url};
    const auto start = std::chrono::steady_clock::now();

    if (!renameTo.empty()) {
        std::error_code ec;
        if (fs::exists(dir / renameTo, ec)) {
            spdlog::info("{} already exists, skipping download", (dir / renameTo).string());
            result.path = dir / renameTo;
            return result;
        }
    }

    downloader::TransferRequest request{url, dir, name};
    auto fetched = acquirer_.fetch(
        request, cfg_.retry, [this](const downloader::ProgressEvent& ev) { onProgress(ev); },
        shouldCancel_);
    if (progress_)
        progress_->stop();

    if (!fetched) {
        result.error = fetched.error();
    } else {
        result.path = fetched.value();
        if (!renameTo.empty() && result.path.filename() != renameTo) {
            std::error_code ec;
            fs::rename(result.path, dir / renameTo, ec);
            if (ec) {
                result.error = Error{ErrorCode::IoError, "Failed to rename " +
                                                             result.path.string() + ": " +
                                                             ec.message()};
            } else {
                result.path = dir / renameTo;
            }
        }
    }
    result.elapsed = since(start);
    return result;
}

ArtifactResult FetchSession::fetchMultipart(const std::string& name,
                                            const std::vector<std::string>& urls,
                                            const fs::path& dir, const std::string& finalName) {
    ArtifactResult result;
    result.name = name;
    result.urls = urls;
    const auto start = std::chrono::steady_clock::now();

    downloader::MultipartAssembler assembler(acquirer_);
    auto fetched = assembler.fetch(
        urls, dir, finalName, cfg_.retry,
        [this](const downloader::ProgressEvent& ev) { onProgress(ev); }, shouldCancel_);
    if (progress_)
        progress_->stop();

    if (!fetched) {
        result.error = fetched.error();
    } else {
        result.path = fetched.value();
    }
    result.elapsed = since(start);
    return result;
}

void FetchSession::verify(ArtifactResult& result, const std::string& expectedSha256) {
    if (!result.ok() || expectedSha256.empty())
        return;
    spdlog::info("Verifying SHA-256 of {}", result.path.string());
    auto verified = downloader::verifySha256(result.path, expectedSha256);
    if (!verified) {
        result.error = verified.error();
        return;
    }
    result.sha256Verified = true;
}

void printHuman(const ArtifactResult& result, std::ostream& out) {
    if (result.ok()) {
        out << "[OK] " << result.name << ": " << result.path.string();
        if (std::error_code ec; fs::is_regular_file(result.path, ec)) {
            out << " (" << ProgressIndicator::formatBytes(fs::file_size(result.path, ec)) << ")";
        }
        if (result.sha256Verified) {
            out << " sha256 verified";
        }
        out << "\n";
    } else {
        out << "[FAIL] " << result.name << ": " << result.error->message << "\n";
    }
}

} // namespace snapfetch::cli
