#pragma once

#include <snapfetch/cli/command.h>
#include <snapfetch/config/fetch_config.h>
#include <snapfetch/downloader/downloader.hpp>

#include <CLI/CLI.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snapfetch::cli {

/**
 * Main CLI application class
 */
class SnapfetchCLI {
public:
    explicit SnapfetchCLI(const std::atomic<bool>* interrupted = nullptr);
    ~SnapfetchCLI();

    /**
     * Run the CLI with given arguments; returns the process exit code
     * (0 success, 1 failure, 2 usage or configuration error).
     */
    int run(int argc, char* argv[]);

    // Commands call this from their CLI11 callback; the command runs after parsing
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    /**
     * Configuration resolved from --config / SNAPFETCH_CONFIG / XDG default.
     * Loaded once, on first use.
     */
    Result<config::FetchConfig> getConfig();

    // Cancellation predicate wired to SIGINT/SIGTERM
    [[nodiscard]] downloader::ShouldCancel cancellation() const;

private:
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};
    const std::atomic<bool>* interrupted_;

    std::string configPath_;
    std::string logLevel_;
    bool verbose_{false};
    std::optional<config::FetchConfig> config_;
};

/**
 * Exit code for a failed command: configuration/usage errors map to 2.
 */
int exitCodeFor(const Error& error) noexcept;

} // namespace snapfetch::cli
