#include <cleanbench/process/command_runner.h>

#include <spdlog/spdlog.h>

#include <exception>

namespace cleanbench::process {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds{50};
constexpr auto kStopGrace = std::chrono::seconds{2};
} // namespace

Result<CommandOutcome> runToCompletion(ServiceProcessConfig config, std::chrono::milliseconds timeout,
                                       std::stop_token stop) {
    const std::string executable = config.executable.string();
    try {
        ServiceProcess child{std::move(config)};
        CommandOutcome outcome;

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!child.wait_for_exit(kPollInterval)) {
            if (stop.stop_requested()) {
                spdlog::debug("Cancelling {} (pid={})", executable, child.pid());
                outcome.cancelled = true;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                spdlog::warn("{} (pid={}) exceeded {}ms, terminating", executable, child.pid(),
                             timeout.count());
                outcome.timedOut = true;
                break;
            }
        }
        if (outcome.cancelled || outcome.timedOut) {
            child.terminate(kStopGrace);
        }

        outcome.exitCode = child.exit_code().value_or(-1);
        for (const auto& line : child.stderr_tail()) {
            if (!outcome.stderrText.empty())
                outcome.stderrText.push_back('\n');
            outcome.stderrText += line;
        }
        return outcome;
    } catch (const std::exception& e) {
        return Error{ErrorCode::SpawnFailed, e.what()};
    }
}

} // namespace cleanbench::process
