#pragma once

#include <atomic>
#include <functional>
#include <stop_token>
#include <thread>

namespace cleanbench::process {

/**
 * @brief Routes SIGINT/SIGTERM/SIGHUP and normal exit into one teardown routine
 *
 * Termination signals are blocked process-wide (blockTerminationSignals() must run before any
 * thread is created) and consumed by a watcher thread via sigtimedwait, so the teardown runs
 * in ordinary thread context. Whichever path calls shutdown() first runs the teardown; later
 * calls are no-ops.
 */
class ShutdownCoordinator {
public:
    using Teardown = std::function<void()>;

    explicit ShutdownCoordinator(Teardown teardown);
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    static void blockTerminationSignals();

    void startSignalWatcher();
    void stopSignalWatcher();

    // Runs the teardown exactly once; returns true for the call that ran it
    bool shutdown();

    // Signal path, also usable directly: request stop then tear down
    void handleSignal(int signal);

    std::stop_token stopToken() const noexcept { return stop_.get_token(); }
    bool stopRequested() const noexcept { return stop_.stop_requested(); }
    int receivedSignal() const noexcept { return signal_.load(); }

private:
    Teardown teardown_;
    std::stop_source stop_;
    std::atomic<bool> tornDown_{false};
    std::atomic<int> signal_{0};
    std::jthread watcher_;
};

} // namespace cleanbench::process
