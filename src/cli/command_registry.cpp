#include <cleanbench/cli/bench_cli.h>
#include <cleanbench/cli/command_registry.h>

namespace cleanbench::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createRunCommand();
std::unique_ptr<ICommand> createSummaryCommand();
std::unique_ptr<ICommand> createRoutesCommand();
std::unique_ptr<ICommand> createSweepCommand();

void CommandRegistry::registerAllCommands(BenchCli* cli) {
    cli->registerCommand(CommandRegistry::createRunCommand());
    cli->registerCommand(CommandRegistry::createSummaryCommand());
    cli->registerCommand(CommandRegistry::createRoutesCommand());
    cli->registerCommand(CommandRegistry::createSweepCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createRunCommand() {
    return ::cleanbench::cli::createRunCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSummaryCommand() {
    return ::cleanbench::cli::createSummaryCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createRoutesCommand() {
    return ::cleanbench::cli::createRoutesCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createSweepCommand() {
    return ::cleanbench::cli::createSweepCommand();
}

} // namespace cleanbench::cli
