#pragma once

#include <CLI/CLI.hpp>
#include <cleanbench/cli/command.h>
#include <cleanbench/config/run_config.h>
#include <cleanbench/process/lifecycle_manager.h>
#include <cleanbench/process/shutdown_coordinator.h>

#include <boost/asio/any_io_executor.hpp>
#include <spdlog/common.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace cleanbench::cli {

/**
 * Main CLI application class
 */
class BenchCli {
public:
    explicit BenchCli(boost::asio::any_io_executor executor);
    ~BenchCli();

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and log setup
     */
    void setPendingCommand(ICommand* cmd);

    /**
     * Configuration from the resolved config file plus environment overrides
     */
    Result<config::RunConfiguration> loadConfiguration() const;

    /**
     * Services registered here are drained and swept on exit and on SIGINT/SIGTERM
     */
    void registerDriver(std::shared_ptr<process::IServiceDriver> driver);

    /**
     * Route log output to <runDir>/cleanbench.log in addition to stderr
     */
    void attachRunLog(const std::filesystem::path& runDir);

    std::stop_token stopToken() const noexcept { return shutdown_->stopToken(); }
    process::ShutdownCoordinator& shutdown() noexcept { return *shutdown_; }
    boost::asio::any_io_executor executor() const { return executor_; }

private:
    void teardown();

    boost::asio::any_io_executor executor_;
    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::string configPath_;
    std::string logLevel_;
    bool verbose_{false};

    std::mutex driversMutex_;
    std::vector<std::shared_ptr<process::IServiceDriver>> drivers_;
    std::unique_ptr<process::ShutdownCoordinator> shutdown_;
};

// Parse a level name ("debug", "warn", ...); nullopt for unknown names
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

} // namespace cleanbench::cli
