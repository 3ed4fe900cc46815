#include <cleanbench/process/shutdown_coordinator.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <exception>

#include <pthread.h>
#include <signal.h>

namespace cleanbench::process {

namespace {

sigset_t termination_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    return set;
}

} // namespace

ShutdownCoordinator::ShutdownCoordinator(Teardown teardown) : teardown_(std::move(teardown)) {}

ShutdownCoordinator::~ShutdownCoordinator() {
    stopSignalWatcher();
}

void ShutdownCoordinator::blockTerminationSignals() {
    auto set = termination_signals();
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

void ShutdownCoordinator::startSignalWatcher() {
    if (watcher_.joinable())
        return;

    watcher_ = std::jthread([this](std::stop_token token) {
        const auto set = termination_signals();
        const timespec tick{0, 100'000'000};
        while (!token.stop_requested()) {
            int signal = sigtimedwait(&set, nullptr, &tick);
            if (signal < 0) {
                if (errno != EAGAIN && errno != EINTR) {
                    spdlog::error("Signal watcher stopped: sigtimedwait failed ({})", errno);
                    return;
                }
                continue;
            }
            handleSignal(signal);
        }
    });
}

void ShutdownCoordinator::stopSignalWatcher() {
    if (watcher_.joinable()) {
        watcher_.request_stop();
        watcher_.join();
    }
}

void ShutdownCoordinator::handleSignal(int signal) {
    int expected = 0;
    if (!signal_.compare_exchange_strong(expected, signal)) {
        spdlog::warn("Received signal {} again, shutdown already in progress", signal);
        return;
    }

    switch (signal) {
        case SIGTERM:
        case SIGINT:
        case SIGHUP:
            spdlog::warn("Received signal {}, stopping benchmark and cleaning up.", signal);
            break;
        default:
            spdlog::warn("Stop requested (signal {})", signal);
            break;
    }
    stop_.request_stop();
    shutdown();
}

bool ShutdownCoordinator::shutdown() {
    if (tornDown_.exchange(true)) {
        return false;
    }
    if (!teardown_) {
        return true;
    }
    try {
        teardown_();
    } catch (const std::exception& e) {
        spdlog::error("Teardown failed: {}", e.what());
    }
    return true;
}

} // namespace cleanbench::process
