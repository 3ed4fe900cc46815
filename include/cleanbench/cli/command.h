#pragma once

#include <CLI/CLI.hpp>
#include <cleanbench/core/types.h>

#include <memory>
#include <string>

namespace cleanbench::cli {

// Forward declarations
class BenchCli;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "run", "summary")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, BenchCli* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

} // namespace cleanbench::cli
