// Process lifecycle manager tests
//
// Spawn/health/terminate against real child processes, the live-process registry and the
// orphan sweep.

#include <catch2/catch_test_macros.hpp>

#include <cleanbench/process/command_runner.h>
#include <cleanbench/process/lifecycle_manager.h>

#include <cerrno>
#include <fstream>
#include <initializer_list>
#include <string>
#include <thread>

#include <signal.h>
#include <unistd.h>

#include "../../support/bench_fakes.hpp"
#include "../../support/scratch_dir.hpp"

using namespace cleanbench;
using namespace cleanbench::process;
using namespace std::chrono_literals;
using cleanbench::test_support::FakeHttpClient;
using cleanbench::test_support::ScratchDir;

namespace {

struct ManagerFixture {
    ManagerFixture() {
        options.gracePeriod = 2s;
        options.pollInterval = 50ms;
        options.probeTimeout = 100ms;
        config.host = "127.0.0.1";
        config.port = 18000;
        config.server.commandTemplate = "sleep 30";
    }

    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    LifecycleOptions options;
    config::RunConfiguration config;
};

bool pidGone(int64_t pid) {
    if (kill(static_cast<pid_t>(pid), 0) != 0 && errno == ESRCH)
        return true;
    // Reparented children of a non-reaping init linger as zombies
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    std::getline(stat, line);
    auto rparen = line.rfind(')');
    return rparen != std::string::npos && rparen + 2 < line.size() && line[rparen + 2] == 'Z';
}

// /proc/<pid>/cmdline layout: NUL-terminated arguments
std::string cmdline(std::initializer_list<std::string> argv) {
    std::string blob;
    for (const auto& arg : argv) {
        blob += arg;
        blob.push_back('\0');
    }
    return blob;
}

template <typename Pred> bool eventually(Pred pred, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(20ms);
    }
    return pred();
}

} // namespace

TEST_CASE_METHOD(ManagerFixture, "Spawned services are registered until terminated",
                 "[process][lifecycle]") {
    ProcessLifecycleManager manager(http, options);

    auto spawned = manager.spawn(config);
    REQUIRE(spawned);
    const auto instance = spawned.value();
    CHECK(instance.pid > 0);
    CHECK(instance.baseUrl() == "http://127.0.0.1:18000");
    CHECK(manager.registry().contains(instance.pid));
    CHECK(manager.registry().contains("127.0.0.1", 18000));

    SECTION("second instance on the same port is refused") {
        auto again = manager.spawn(config);
        REQUIRE_FALSE(again);
        CHECK(again.error().code == ErrorCode::InvalidState);
        CHECK(manager.registry().size() == 1);
    }

    SECTION("terminate is idempotent") {
        manager.terminate(instance);
        CHECK(manager.registry().empty());
        CHECK(eventually([&] { return pidGone(instance.pid); }));
        manager.terminate(instance);
        CHECK(manager.registry().empty());
    }

    SECTION("terminateAll drains every instance") {
        auto other = config;
        other.port = 18001;
        REQUIRE(manager.spawn(other));
        CHECK(manager.registry().size() == 2);
        manager.terminateAll();
        CHECK(manager.registry().empty());
        CHECK(eventually([&] { return pidGone(instance.pid); }));
    }
}

TEST_CASE_METHOD(ManagerFixture, "Spawn failures are reported, not thrown",
                 "[process][lifecycle]") {
    ProcessLifecycleManager manager(http, options);
    config.server.commandTemplate = "/nonexistent/cleanbench-server --port {port}";
    auto spawned = manager.spawn(config);
    REQUIRE_FALSE(spawned);
    CHECK(spawned.error().code == ErrorCode::SpawnFailed);
    CHECK(manager.registry().empty());
}

TEST_CASE_METHOD(ManagerFixture, "awaitHealthy polls the health endpoint",
                 "[process][lifecycle][health]") {
    ProcessLifecycleManager manager(http, options);

    SECTION("healthy on HTTP 200") {
        auto instance = manager.spawn(config).value();
        CHECK(manager.awaitHealthy(instance, 2s));
        REQUIRE_FALSE(http->requests.empty());
        CHECK(http->requests.front() == "GET http://127.0.0.1:18000/health");
        manager.terminate(instance);
    }

    SECTION("times out while the service refuses connections") {
        http->failTransport = true;
        auto instance = manager.spawn(config).value();
        const auto started = std::chrono::steady_clock::now();
        CHECK_FALSE(manager.awaitHealthy(instance, 300ms));
        CHECK(std::chrono::steady_clock::now() - started < 2s);
        CHECK(http->requests.size() >= 2);
        manager.terminate(instance);
    }

    SECTION("non-200 statuses do not count") {
        http->status = 503;
        auto instance = manager.spawn(config).value();
        CHECK_FALSE(manager.awaitHealthy(instance, 200ms));
        manager.terminate(instance);
    }

    SECTION("gives up as soon as the process dies") {
        http->failTransport = true;
        config.server.commandTemplate = "sh -c 'echo address already in use >&2; exit 1'";
        auto instance = manager.spawn(config).value();
        const auto started = std::chrono::steady_clock::now();
        CHECK_FALSE(manager.awaitHealthy(instance, 30s));
        CHECK(std::chrono::steady_clock::now() - started < 5s);
        manager.terminate(instance);
        CHECK(manager.registry().empty());
    }
}

TEST_CASE_METHOD(ManagerFixture, "Destroying the manager stops live services",
                 "[process][lifecycle]") {
    int64_t pid = 0;
    {
        ProcessLifecycleManager manager(http, options);
        pid = manager.spawn(config).value().pid;
    }
    CHECK(eventually([&] { return pidGone(pid); }));
}

TEST_CASE_METHOD(ManagerFixture, "sweepOrphans terminates matching unregistered processes",
                 "[process][lifecycle][orphans]") {
    auto dir = ScratchDir("cleanbench-orphans");
    auto pidFile = dir.path() / "orphan.pid";
    // Unusual duration so the signature matches nothing else on the host
    const std::string marker = "31" + std::to_string(100 + ::getpid() % 800) + ".5";

    auto launched = runToCompletion(
        [&] {
            ServiceProcessConfig launcher;
            launcher.executable = "/bin/sh";
            launcher.args = {"-c", "sleep " + marker + " >/dev/null 2>&1 & echo $! > '" +
                                       pidFile.string() + "'"};
            return launcher;
        }(),
        5s);
    REQUIRE(launched);
    REQUIRE(launched.value().succeeded());

    int64_t orphan = 0;
    REQUIRE(eventually([&] {
        std::ifstream in(pidFile);
        return static_cast<bool>(in >> orphan) && orphan > 0;
    }));

    options.signature = "sleep " + marker;
    ProcessLifecycleManager manager(http, options);

    SECTION("registered services are left alone") {
        auto registered = config;
        registered.server.commandTemplate = "sleep " + marker;
        auto instance = manager.spawn(registered).value();

        CHECK(manager.sweepOrphans() == 1);
        CHECK(eventually([&] { return pidGone(orphan); }));
        CHECK(manager.registry().isAlive(instance.pid));
        manager.terminate(instance);
    }

    SECTION("wrappers whose command line mentions the signature survive") {
        auto childFile = dir.path() / "child.pid";
        ServiceProcessConfig wrapperConfig;
        wrapperConfig.executable = "/bin/sh";
        wrapperConfig.args = {"-c", "sleep " + marker + " & echo $! > '" + childFile.string() +
                                        "'; wait; sleep 30"};
        ServiceProcess wrapper(wrapperConfig);

        int64_t child = 0;
        REQUIRE(eventually([&] {
            std::ifstream in(childFile);
            return static_cast<bool>(in >> child) && child > 0;
        }));

        CHECK(manager.sweepOrphans() == 2);
        CHECK(eventually([&] { return pidGone(orphan) && pidGone(child); }));
        CHECK(wrapper.is_alive());
        wrapper.terminate(2s);
    }

    SECTION("empty signature sweeps nothing") {
        options.signature.clear();
        ProcessLifecycleManager blind(http, options);
        CHECK(blind.sweepOrphans() == 0);
        CHECK(manager.sweepOrphans() == 1);
    }
}

TEST_CASE_METHOD(ManagerFixture, "sweepOrphans spares the processes that launched it",
                 "[process][lifecycle][orphans]") {
    // Fake process table: our parent runs the exact launch command, our grandparent is a
    // shell wrapper mentioning it. PIDs above the kernel's pid_max cannot exist.
    auto proc = ScratchDir("cleanbench-fakeproc");
    const auto self = std::to_string(::getpid());
    proc.writeFile(self + "/cmdline", cmdline({"cleanbench", "sweep"}));
    proc.writeFile(self + "/status", "Name:\tcleanbench\nPPid:\t4194401\n");
    proc.writeFile("4194401/cmdline", cmdline({"uvicorn", "app:app", "--port", "8000"}));
    proc.writeFile("4194401/status", "Name:\tuvicorn\nPPid:\t4194402\n");
    proc.writeFile("4194402/cmdline",
                   cmdline({"bash", "-c", "uvicorn app:app --port 8000 && cleanbench sweep"}));
    proc.writeFile("4194402/status", "Name:\tbash\nPPid:\t1\n");

    options.procRoot = proc.path();
    options.signature = "uvicorn app:app --port 8000";
    ProcessLifecycleManager manager(http, options);

    SECTION("ancestors are never signalled") {
        CHECK(manager.sweepOrphans() == 0);
    }

    SECTION("an unrelated process with the same argv is") {
        proc.writeFile("4194403/cmdline",
                       cmdline({"/usr/bin/python3", "/usr/local/bin/uvicorn", "app:app", "--port",
                                "8000", "--workers", "4"}));
        proc.writeFile("4194403/status", "Name:\tuvicorn\nPPid:\t1\n");
        CHECK(manager.sweepOrphans() == 1);
    }
}

TEST_CASE("matchesLaunchSignature compares argv entries", "[process][lifecycle][orphans]") {
    const std::vector<std::string> signature{"uvicorn", "app:app", "--port", "8000"};
    using Argv = std::vector<std::string>;

    CHECK(matchesLaunchSignature(Argv{"uvicorn", "app:app", "--port", "8000"}, signature));
    CHECK(matchesLaunchSignature(Argv{"/opt/venv/bin/uvicorn", "app:app", "--port", "8000",
                                      "--workers", "4"},
                                 signature));
    CHECK(matchesLaunchSignature(Argv{"python3", "/usr/bin/uvicorn", "app:app", "--port", "8000"},
                                 signature));
    CHECK(matchesLaunchSignature(Argv{"python3", "-m", "uvicorn", "app:app", "--port", "8000"},
                                 signature));

    CHECK_FALSE(matchesLaunchSignature(
        Argv{"sh", "-c", "uvicorn app:app --port 8000; echo done"}, signature));
    CHECK_FALSE(matchesLaunchSignature(
        Argv{"cleanbench", "sweep", "--signature", "uvicorn app:app --port 8000"}, signature));
    CHECK_FALSE(matchesLaunchSignature(
        Argv{"timeout", "60", "uvicorn", "app:app", "--port", "8000"}, signature));
    CHECK_FALSE(matchesLaunchSignature(Argv{"uvicorn", "app:app", "--port", "8001"}, signature));
    CHECK_FALSE(matchesLaunchSignature(Argv{"uvicorn", "app:app"}, signature));
    CHECK_FALSE(matchesLaunchSignature(Argv{}, signature));
    CHECK_FALSE(matchesLaunchSignature(Argv{"uvicorn"}, {}));
}

TEST_CASE("ProcessRegistry ownership", "[process][registry]") {
    ProcessRegistry registry;
    ServiceProcessConfig config;
    config.executable = "sleep";
    config.args = {"30"};

    auto process = std::make_unique<ServiceProcess>(config);
    const auto pid = process->pid();
    registry.add(std::move(process), "127.0.0.1", 9000);
    registry.add(nullptr, "127.0.0.1", 9001);

    CHECK(registry.size() == 1);
    CHECK(registry.pids() == std::vector<int64_t>{pid});
    CHECK(registry.isAlive(pid));
    CHECK_FALSE(registry.isAlive(pid + 1));
    CHECK(registry.stderrTail(pid + 1).empty());

    auto taken = registry.take(pid);
    REQUIRE(taken);
    CHECK(registry.empty());
    CHECK(registry.take(pid) == nullptr);
    CHECK(registry.drain().empty());
    taken->terminate(2s);
}
