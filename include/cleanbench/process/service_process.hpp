#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cleanbench::process {

/**
 * @brief Lifecycle state of a child process
 */
enum class ProcessState : uint8_t {
    Unstarted,    ///< Process not yet spawned
    Starting,     ///< Process spawn in progress
    Running,      ///< exec succeeded, process is running
    ShuttingDown, ///< Shutdown initiated
    Terminated,   ///< Process has exited
    Failed        ///< Spawn failed
};

const char* toString(ProcessState state) noexcept;

/**
 * @brief Configuration for spawning a child process
 *
 * Example:
 * @code
 * ServiceProcessConfig config{
 *     .executable = "uvicorn",
 *     .args = {"app.main:app", "--port", "8000"}
 * };
 * config.with_env("PYTHONUNBUFFERED", "1").in_directory("/srv/app");
 * @endcode
 */
struct ServiceProcessConfig {
    std::filesystem::path executable;                  ///< Resolved through PATH
    std::vector<std::string> args;                     ///< Arguments after argv[0]
    std::unordered_map<std::string, std::string> env;  ///< Extra environment variables
    std::optional<std::filesystem::path> workdir;      ///< Working directory (optional)
    std::optional<std::filesystem::path> stdout_file;  ///< Redirect stdout here instead of a pipe
    bool own_process_group{true};                      ///< setpgid(0,0); signals go to the group
    size_t stderr_tail_lines{20};                      ///< stderr lines kept for diagnostics

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }

    auto& stdout_to(std::filesystem::path file) {
        stdout_file = std::move(file);
        return *this;
    }
};

/**
 * @brief RAII wrapper for a spawned child process
 *
 * The child is started in its own process group so that termination reaches
 * worker processes it forks. stdout/stderr are pumped by background threads
 * (logged at trace/debug) so the child never blocks on a full pipe.
 *
 * **Thread Safety:**
 * All public methods are thread-safe. Reaping (waitpid) is serialized internally.
 */
class ServiceProcess {
public:
    /**
     * @brief Construct and spawn the process
     * @throws std::runtime_error if fork or exec fails
     */
    explicit ServiceProcess(ServiceProcessConfig config);

    /**
     * @brief Terminates the process (5s grace) if still alive
     */
    ~ServiceProcess();

    ServiceProcess(const ServiceProcess&) = delete;
    ServiceProcess& operator=(const ServiceProcess&) = delete;

    ServiceProcess(ServiceProcess&&) noexcept;
    ServiceProcess& operator=(ServiceProcess&&) noexcept;

    [[nodiscard]] ProcessState state() const noexcept;

    /**
     * @brief Check if the process is running (reaps it if it has exited)
     */
    [[nodiscard]] bool is_alive() const noexcept;

    /**
     * @brief Terminate gracefully, escalating to a forced kill
     *
     * Sends SIGTERM (to the process group when one was created), waits up to
     * @p timeout, then sends SIGKILL. No-op if the process already exited.
     *
     * @return true if SIGKILL was required
     */
    bool terminate(std::chrono::milliseconds timeout = std::chrono::seconds{5});

    [[nodiscard]] int64_t pid() const noexcept;

    /**
     * @brief Wait for the process to exit
     * @return true if process exited within timeout
     */
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

    /**
     * @brief Exit code (128 + signal for signalled exits), or std::nullopt if running
     */
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

    /**
     * @brief Last captured stderr lines, oldest first
     */
    [[nodiscard]] std::vector<std::string> stderr_tail() const;

    /**
     * @brief Full command line as launched (argv joined by spaces)
     */
    [[nodiscard]] std::string command_line() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cleanbench::process
