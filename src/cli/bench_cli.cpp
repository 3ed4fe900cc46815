#include <cleanbench/cli/bench_cli.h>
#include <cleanbench/cli/command_registry.h>
#include <cleanbench/config/config_helpers.h>
#include <cleanbench/version.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <iostream>

namespace cleanbench::cli {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
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

BenchCli::BenchCli(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {
    // Set a conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    shutdown_ = std::make_unique<process::ShutdownCoordinator>([this] { teardown(); });

    app_ = std::make_unique<CLI::App>("Clean-room HTTP benchmark orchestrator", "cleanbench");
    app_->require_subcommand(1);
    app_->set_version_flag("--version", CLEANBENCH_VERSION_LONG_STRING);

    app_->add_option("--config", configPath_, "Path to config.toml");
    app_->add_option("--log-level", logLevel_, "Log level (trace, debug, info, warn, error, off)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
}

BenchCli::~BenchCli() {
    shutdown_->shutdown();
    shutdown_->stopSignalWatcher();
}

void BenchCli::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void BenchCli::setPendingCommand(ICommand* cmd) {
    pendingCommand_ = cmd;
}

Result<config::RunConfiguration> BenchCli::loadConfiguration() const {
    return config::loadRunConfiguration(config::get_config_path(configPath_));
}

void BenchCli::registerDriver(std::shared_ptr<process::IServiceDriver> driver) {
    std::lock_guard lock{driversMutex_};
    drivers_.push_back(std::move(driver));
}

void BenchCli::teardown() {
    std::vector<std::shared_ptr<process::IServiceDriver>> drivers;
    {
        std::lock_guard lock{driversMutex_};
        drivers = drivers_;
    }
    if (drivers.empty())
        return;

    spdlog::info("Cleaning up service processes...");
    for (const auto& driver : drivers) {
        driver->terminateAll();
        driver->sweepOrphans();
    }
    spdlog::info("Cleanup complete");
}

void BenchCli::attachRunLog(const std::filesystem::path& runDir) {
    try {
        auto current = spdlog::default_logger();
        std::vector<spdlog::sink_ptr> sinks = current->sinks();
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (runDir / "cleanbench.log").string(), true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        sinks.push_back(fileSink);

        auto logger = std::make_shared<spdlog::logger>("cleanbench", sinks.begin(), sinks.end());
        logger->set_level(current->level());
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::warn("Cannot open run log in {}: {}", runDir.string(), e.what());
    }
}

int BenchCli::run(int argc, char* argv[]) {
    try {
        CommandRegistry::registerAllCommands(this);

        app_->parse(argc, argv);

        // Apply log level after parsing flags
        // Precedence: --log-level > env CLEANBENCH_LOG_LEVEL > --verbose > info
        std::optional<spdlog::level::level_enum> level;
        if (!logLevel_.empty()) {
            level = parseLogLevel(logLevel_);
            if (!level) {
                std::cerr << "[FAIL] Unknown log level '" << logLevel_ << "'\n";
                return 1;
            }
        } else if (auto env = config::env_value("CLEANBENCH_LOG_LEVEL")) {
            level = parseLogLevel(*env);
        }
        if (!level) {
            level = verbose_ ? spdlog::level::debug : spdlog::level::info;
        }
        spdlog::set_level(*level);

        shutdown_->startSignalWatcher();

        Result<void> result;
        if (pendingCommand_) {
            result = pendingCommand_->execute();
        }

        // Normal exit path shares the signal path's teardown
        shutdown_->shutdown();

        // Interrupted runs exit 0; the persisted metadata says "interrupted"
        if (int sig = shutdown_->receivedSignal(); sig != 0) {
            spdlog::info("Stopped by signal {}", sig);
        }
        if (!result) {
            std::cerr << "[FAIL] " << errorToString(result.error().code) << ": "
                      << result.error().message << "\n";
            return 1;
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        shutdown_->shutdown();
        return 1;
    }
}

} // namespace cleanbench::cli
