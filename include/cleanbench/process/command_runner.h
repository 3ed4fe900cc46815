#pragma once

#include <cleanbench/core/types.h>
#include <cleanbench/process/service_process.hpp>

#include <chrono>
#include <stop_token>
#include <string>

namespace cleanbench::process {

struct CommandOutcome {
    int exitCode{-1};
    std::string stderrText; ///< Tail of stderr, newline-joined
    bool timedOut{false};
    bool cancelled{false};

    bool succeeded() const noexcept { return exitCode == 0 && !timedOut && !cancelled; }
};

/**
 * Run a short-lived command to completion.
 *
 * The child is terminated if @p timeout elapses or @p stop is requested; both cases are
 * reported in the outcome rather than as errors. Spawn failure is returned as SpawnFailed.
 */
Result<CommandOutcome> runToCompletion(ServiceProcessConfig config, std::chrono::milliseconds timeout,
                                       std::stop_token stop = {});

} // namespace cleanbench::process
