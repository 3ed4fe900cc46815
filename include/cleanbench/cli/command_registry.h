#pragma once

#include <cleanbench/cli/command.h>

#include <memory>

namespace cleanbench::cli {

// Forward declaration
class BenchCli;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(BenchCli* cli);

    static std::unique_ptr<ICommand> createRunCommand();
    static std::unique_ptr<ICommand> createSummaryCommand();
    static std::unique_ptr<ICommand> createRoutesCommand();
    static std::unique_ptr<ICommand> createSweepCommand();
};

} // namespace cleanbench::cli
