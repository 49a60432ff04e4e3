#pragma once

#include <snapfetch/core/types.h>

#include <CLI/CLI.hpp>

#include <memory>
#include <string>

namespace snapfetch::cli {

// Forward declarations
class SnapfetchCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "get", "run")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, SnapfetchCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;

    /**
     * True once execute() has printed its own result, failures included.
     * The CLI then only sets the exit code.
     */
    virtual bool resultReported() const { return false; }
};

std::unique_ptr<ICommand> createGetCommand();
std::unique_ptr<ICommand> createRunCommand();

} // namespace snapfetch::cli
