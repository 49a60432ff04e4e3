#include <snapfetch/cli/snapfetch_cli.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so --json output on stdout stays parseable
        auto logger = spdlog::stderr_color_mt("snapfetch");
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        snapfetch::cli::SnapfetchCLI cli(&g_interrupted);
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
