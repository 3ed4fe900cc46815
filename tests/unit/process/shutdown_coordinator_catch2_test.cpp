// Shutdown coordinator tests

#include <catch2/catch_test_macros.hpp>

#include <cleanbench/process/shutdown_coordinator.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include <signal.h>
#include <unistd.h>

using namespace cleanbench::process;
using namespace std::chrono_literals;

TEST_CASE("Teardown runs exactly once", "[process][shutdown]") {
    std::atomic<int> calls{0};
    ShutdownCoordinator coordinator([&] { ++calls; });

    SECTION("normal exit path") {
        CHECK(coordinator.shutdown());
        CHECK_FALSE(coordinator.shutdown());
        CHECK(calls == 1);
        CHECK_FALSE(coordinator.stopRequested());
        CHECK(coordinator.receivedSignal() == 0);
    }

    SECTION("signal path") {
        coordinator.handleSignal(SIGTERM);
        coordinator.handleSignal(SIGINT);
        CHECK(calls == 1);
        CHECK(coordinator.stopRequested());
        CHECK(coordinator.stopToken().stop_requested());
        CHECK(coordinator.receivedSignal() == SIGTERM);
        CHECK_FALSE(coordinator.shutdown());
    }

    SECTION("signal after normal exit still requests stop") {
        CHECK(coordinator.shutdown());
        coordinator.handleSignal(SIGHUP);
        CHECK(calls == 1);
        CHECK(coordinator.stopRequested());
        CHECK(coordinator.receivedSignal() == SIGHUP);
    }

    SECTION("concurrent callers") {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] { coordinator.shutdown(); });
        }
        threads.clear();
        CHECK(calls == 1);
    }
}

TEST_CASE("A throwing teardown is contained", "[process][shutdown]") {
    ShutdownCoordinator coordinator([] { throw std::runtime_error("registry already gone"); });
    CHECK_NOTHROW(coordinator.shutdown());
    CHECK_FALSE(coordinator.shutdown());
}

TEST_CASE("Signal watcher turns a delivered signal into teardown", "[process][shutdown]") {
    // Blocked before the watcher thread exists so it inherits the mask
    ShutdownCoordinator::blockTerminationSignals();

    std::atomic<int> calls{0};
    ShutdownCoordinator coordinator([&] { ++calls; });
    coordinator.startSignalWatcher();

    REQUIRE(::kill(::getpid(), SIGHUP) == 0);

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (calls == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    coordinator.stopSignalWatcher();

    CHECK(calls == 1);
    CHECK(coordinator.receivedSignal() == SIGHUP);
    CHECK(coordinator.stopRequested());
}
