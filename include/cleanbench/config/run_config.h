#pragma once

#include <cleanbench/core/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cleanbench::config {

inline constexpr const char* kDefaultServerCommand =
    "uvicorn app.main:app --host {host} --port {port} --workers {workers} --no-access-log "
    "--log-level warning";

/**
 * @brief How the service under test is launched and probed
 */
struct ServerSettings {
    std::string commandTemplate{kDefaultServerCommand}; ///< {host} {port} {workers} placeholders
    std::string healthPath{"/health"};
    std::string seedPath{"/api/db/seed"};
    std::string resourceId{"1000"}; ///< Substituted into `{...}` URL placeholders
    std::string signature;          ///< Orphan match string; empty = rendered command line
};

struct LoadGenSettings {
    std::string binary{"vegeta"};
    std::chrono::milliseconds requestTimeout{std::chrono::seconds{10}};
};

/**
 * @brief Immutable settings for one benchmark run
 */
struct RunConfiguration {
    std::vector<int> rates{1000, 5000, 10000};
    std::string host{"127.0.0.1"};
    int port{8000};
    std::chrono::milliseconds duration{std::chrono::seconds{10}};
    std::string durationText{"10s"}; ///< Textual form persisted in run metadata
    int workers{1};
    std::optional<std::string> filterPrefix;

    ServerSettings server;
    LoadGenSettings loadgen;
    std::filesystem::path outputRoot{".tmp"};
    std::filesystem::path routesPath{"routes.json"};

    double durationSeconds() const {
        return std::chrono::duration<double>(duration).count();
    }

    std::string baseUrl() const { return "http://" + host + ":" + std::to_string(port); }
};

/**
 * Resolve configuration: defaults, then config.toml, then CLEANBENCH_* environment.
 * A missing config file is not an error; malformed values are.
 */
Result<RunConfiguration> loadRunConfiguration(const std::filesystem::path& configFile);

Result<void> validateRunConfiguration(const RunConfiguration& config);

Result<void> setDuration(RunConfiguration& config, const std::string& text);

// Split a command template on whitespace, honouring single and double quotes.
std::vector<std::string> splitCommandLine(const std::string& command);

// Server argv with {host}, {port} and {workers} substituted.
std::vector<std::string> renderServerCommand(const RunConfiguration& config);

// String matched against /proc/<pid>/cmdline when sweeping orphans.
std::string launchSignature(const RunConfiguration& config);

} // namespace cleanbench::config
