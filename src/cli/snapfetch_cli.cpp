#include <snapfetch/cli/snapfetch_cli.h>
#include <snapfetch/version.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <iostream>

namespace snapfetch::cli {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

int exitCodeFor(const Error& error) noexcept {
    switch (error.code) {
        case ErrorCode::Success:
            return 0;
        case ErrorCode::InvalidArgument:
            return 2;
        default:
            return 1;
    }
}

SnapfetchCLI::SnapfetchCLI(const std::atomic<bool>* interrupted) : interrupted_(interrupted) {
    app_ = std::make_unique<CLI::App>("snapfetch - resumable artifact downloader", "snapfetch");
    app_->set_version_flag("--version", SNAPFETCH_VERSION_STRING);
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_,
                     "Config file (default: $SNAPFETCH_CONFIG or "
                     "$XDG_CONFIG_HOME/snapfetch/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_option("--log-level", logLevel_, "trace|debug|info|warn|error|critical|off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "err",
                               "critical", "off"},
                              CLI::ignore_case));

    commands_.push_back(createGetCommand());
    commands_.push_back(createRunCommand());
    for (auto& cmd : commands_) {
        cmd->registerCommand(*app_, this);
    }
}

SnapfetchCLI::~SnapfetchCLI() = default;

void SnapfetchCLI::applyLogLevel() {
    // Precedence: env SNAPFETCH_LOG_LEVEL > --log-level > --verbose > warn
    if (const char* envLvl = std::getenv("SNAPFETCH_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (!logLevel_.empty()) {
        if (auto lvl = parseLevel(logLevel_)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

Result<config::FetchConfig> SnapfetchCLI::getConfig() {
    if (!config_) {
        auto loaded = config::loadFetchConfig(configPath_);
        if (!loaded) {
            // Unreadable or missing config is a configuration error (exit 2)
            return Error{ErrorCode::InvalidArgument, loaded.error().message};
        }
        config_ = std::move(loaded).value();
    }
    return *config_;
}

downloader::ShouldCancel SnapfetchCLI::cancellation() const {
    const auto* flag = interrupted_;
    return [flag]() { return flag != nullptr && flag->load(); };
}

int SnapfetchCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app_->exit(e);
        return code == 0 ? 0 : 2;
    }

    applyLogLevel();

    if (!pendingCommand_) {
        std::cerr << app_->help() << "\n";
        return 2;
    }

    auto result = pendingCommand_->execute();
    if (!result) {
        spdlog::debug("{} command failed: {}", pendingCommand_->getName(),
                      result.error().message);
        if (!pendingCommand_->resultReported()) {
            std::cerr << "[FAIL] " << errorToString(result.error().code) << ": "
                      << result.error().message << "\n";
        }
        return exitCodeFor(result.error());
    }
    return 0;
}

} // namespace snapfetch::cli
