#include <snapfetch/cli/command.h>
#include <snapfetch/cli/snapfetch_cli.h>

#include "../fetch_session.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <iostream>

namespace snapfetch::cli {

using json = nlohmann::json;

class RunCommand : public ICommand {
public:
    std::string getName() const override { return "run"; }

    std::string getDescription() const override {
        return "Fetch the configured artifacts (binary, snapshot, address book).";
    }

    void registerCommand(CLI::App& app, SnapfetchCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("run", getDescription());
        cmd->add_flag("--skip-binary", skipBinary_, "Do not fetch artifacts.binary_url.");
        cmd->add_flag("--skip-snapshot", skipSnapshot_, "Do not fetch the snapshot.");
        cmd->add_flag("--skip-addrbook", skipAddrbook_, "Do not fetch artifacts.addrbook_url.");
        cmd->add_flag("--json", jsonOutput_, "Emit results as JSON to stdout.");
        cmd->add_flag("--no-progress", noProgress_, "Do not render progress bars.");

        cmd->footer(R"(Artifacts are read from the [artifacts] section of the config file and
fetched one after another into download.dir. snapshot_urls (multipart) takes
precedence over snapshot_url and requires snapshot_filename.)");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfgRes = cli_->getConfig();
        if (!cfgRes) {
            return cfgRes.error();
        }
        const auto cfg = std::move(cfgRes).value();
        const auto& artifacts = cfg.artifacts;

        const bool showProgress = !noProgress_ && ::isatty(STDERR_FILENO) != 0;
        FetchSession session(cfg, showProgress, cli_->cancellation());

        std::vector<ArtifactResult> results;
        auto report = [&](ArtifactResult r) {
            if (!jsonOutput_) {
                printHuman(r, std::cout);
            }
            results.push_back(std::move(r));
            return results.back().ok();
        };

        bool ok = true;
        bool attempted = false;
        if (!skipBinary_ && !artifacts.binaryUrl.empty()) {
            attempted = true;
            ok = report(session.fetchSingle("binary", artifacts.binaryUrl, cfg.downloadDir));
        }

        const auto snapshotUrls = artifacts.snapshotUrlList();
        if (ok && !skipSnapshot_ && !snapshotUrls.empty()) {
            attempted = true;
            ArtifactResult snap =
                artifacts.isMultipartSnapshot()
                    ? session.fetchMultipart("snapshot", snapshotUrls, cfg.downloadDir,
                                             artifacts.snapshotFilename)
                    : session.fetchSingle("snapshot", snapshotUrls.front(), cfg.downloadDir);
            session.verify(snap, artifacts.snapshotSha256);
            ok = report(std::move(snap));
        }

        if (ok && !skipAddrbook_ && !artifacts.addrbookUrl.empty()) {
            attempted = true;
            ok = report(session.fetchSingle("addrbook", artifacts.addrbookUrl, cfg.downloadDir));
        }

        if (jsonOutput_) {
            json out = json::array();
            for (const auto& r : results) {
                out.push_back(r.toJson());
            }
            std::cout << out.dump(2) << std::endl;
        }
        reported_ = !results.empty();

        if (!attempted) {
            spdlog::warn("No artifacts configured{}",
                         cfg.loadedFrom.empty() ? std::string(" (no config file found)")
                                                : " in " + cfg.loadedFrom.string());
        }
        for (const auto& r : results) {
            if (!r.ok()) {
                return *r.error;
            }
        }
        return Result<void>();
    }

    bool resultReported() const override { return reported_; }

private:
    SnapfetchCLI* cli_{nullptr};
    bool reported_{false};
    bool skipBinary_{false};
    bool skipSnapshot_{false};
    bool skipAddrbook_{false};
    bool jsonOutput_{false};
    bool noProgress_{false};
};

std::unique_ptr<ICommand> createRunCommand() {
    return std::make_unique<RunCommand>();
}

} // namespace snapfetch::cli
