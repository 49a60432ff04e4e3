#include <snapfetch/cli/command.h>
#include <snapfetch/cli/snapfetch_cli.h>

#include "../fetch_session.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <iostream>
#include <optional>
#include <regex>

namespace snapfetch::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

class GetCommand : public ICommand {
public:
    std::string getName() const override { return "get"; }

    std::string getDescription() const override {
        return "Download one URL, or several parts concatenated into one file (requires -o).";
    }

    void registerCommand(CLI::App& app, SnapfetchCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("get", getDescription());

        cmd->add_option("urls", urls_, "Source URL(s): http://, https:// or s3://bucket/key")
            ->required();
        cmd->add_option("-d,--dir", dir_, "Destination directory (default: download.dir).");
        cmd->add_option("-o,--output", output_,
                        "Final filename; required when more than one URL is given.");

        // Retry policy
        cmd->add_option("--max-retries", maxRetries_, "Retries after the first attempt.")
            ->check(CLI::Range(0, 1000));
        cmd->add_option("--initial-delay-ms", initialDelayMs_, "First backoff delay in ms.")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--max-delay-ms", maxDelayMs_, "Backoff ceiling in ms.")
            ->check(CLI::NonNegativeNumber);
        cmd->add_option("--multiplier", multiplier_, "Backoff multiplier.")
            ->check(CLI::Range(1.0, 100.0));

        // Transport
        cmd->add_flag("--tls-insecure", tlsInsecure_,
                      "Disable TLS verification (NOT RECOMMENDED).");
        cmd->add_option("--s3-region", s3Region_, "Region for s3:// URLs.");
        cmd->add_option("--s3-endpoint", s3Endpoint_,
                        "S3-compatible endpoint, e.g. http://127.0.0.1:9000 (path-style).");

        // Integrity
        cmd->add_option("--sha256", sha256_, "Expected SHA-256 of the final file (hex).")
            ->check(CLI::Validator(
                [](std::string& s) {
                    static const std::regex re(R"(^[0-9a-fA-F]{64}$)");
                    return std::regex_match(s, re)
                               ? std::string{}
                               : std::string{"expected 64 hex characters"};
                },
                "SHA256"));

        // Output / UX
        cmd->add_flag("--json", jsonOutput_,
                      "Emit final result as JSON to stdout (progress to stderr).");
        cmd->add_flag("--no-progress", noProgress_, "Do not render a progress bar.");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (urls_.size() > 1 && output_.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         "Several URLs are downloaded as parts of one file; pass -o <filename>"};
        }

        auto cfgRes = cli_->getConfig();
        if (!cfgRes) {
            return cfgRes.error();
        }
        auto cfg = std::move(cfgRes).value();

        if (maxRetries_)
            cfg.retry.maxRetries = *maxRetries_;
        if (initialDelayMs_)
            cfg.retry.initialDelay = std::chrono::milliseconds(*initialDelayMs_);
        if (maxDelayMs_)
            cfg.retry.maxDelay = std::chrono::milliseconds(*maxDelayMs_);
        if (multiplier_)
            cfg.retry.backoffMultiplier = *multiplier_;
        if (tlsInsecure_)
            cfg.source.http.tls.insecure = true;
        if (!s3Region_.empty())
            cfg.source.s3.region = s3Region_;
        if (!s3Endpoint_.empty())
            cfg.source.s3.endpoint = s3Endpoint_;

        const fs::path dir = dir_.empty() ? cfg.downloadDir : fs::path(dir_);
        const bool showProgress = !noProgress_ && ::isatty(STDERR_FILENO) != 0;
        FetchSession session(cfg, showProgress, cli_->cancellation());

        ArtifactResult result;
        if (urls_.size() == 1) {
            auto derived = downloader::fileNameFromUrl(urls_.front());
            const std::string name =
                !output_.empty() ? output_ : (derived ? derived.value() : urls_.front());
            result = session.fetchSingle(name, urls_.front(), dir, output_);
        } else {
            result = session.fetchMultipart(output_, urls_, dir, output_);
        }
        session.verify(result, sha256_);

        if (jsonOutput_) {
            std::cout << result.toJson().dump(2) << std::endl;
        } else {
            printHuman(result, std::cout);
        }
        reported_ = true;

        if (!result.ok()) {
            return *result.error;
        }
        return Result<void>();
    }

    bool resultReported() const override { return reported_; }

private:
    SnapfetchCLI* cli_{nullptr};
    bool reported_{false};
    std::vector<std::string> urls_;
    std::string dir_;
    std::string output_;
    std::optional<std::uint32_t> maxRetries_;
    std::optional<std::uint64_t> initialDelayMs_;
    std::optional<std::uint64_t> maxDelayMs_;
    std::optional<double> multiplier_;
    bool tlsInsecure_{false};
    std::string s3Region_;
    std::string s3Endpoint_;
    std::string sha256_;
    bool jsonOutput_{false};
    bool noProgress_{false};
};

std::unique_ptr<ICommand> createGetCommand() {
    return std::make_unique<GetCommand>();
}

} // namespace snapfetch::cli
