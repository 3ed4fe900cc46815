// Orchestrator tests
//
// Full runs against in-memory collaborators: cycle ordering, per-cycle teardown, failure codes of
// skipped cycles and interruption with a partial result on disk.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cleanbench/bench/orchestrator.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "../../support/bench_fakes.hpp"
#include "../../support/scratch_dir.hpp"

using namespace cleanbench;
using namespace cleanbench::bench;
using namespace std::chrono_literals;
using Catch::Approx;
using cleanbench::test_support::ScratchDir;

namespace {

struct OrchestratorFixture {
    OrchestratorFixture()
        : dir("cleanbench-orchestrator"),
          store(std::vector<std::filesystem::path>{dir.path()}),
          guard(boost::asio::make_work_guard(io)), runner([this] { io.run(); }) {
        config.rates = {100, 200};
        config.duration = 50ms;
        config.durationText = "50ms";
        config.workers = 2;

        endpoints = {{"read", "GET", "/api/db/read/{item_id}"},
                     {"write", "POST", "/api/db/write/{item_id}"},
                     {"cache", "GET", "/api/cache/get/{key}"},
                     {"stats", "GET", "/api/cache/stats"},
                     {"fib", "GET", "/api/compute/fib"}};

        timings.healthTimeout = 100ms;
        timings.seedTimeout = 100ms;
        timings.seedSettle = 0ms;
        timings.smokeTimeout = 100ms;
        timings.stabilization = 0ms;
        timings.samplerSlack = 0ms;
        timings.interCycle = 0ms;

        deps.driver = driver;
        deps.http = http;
        deps.load = load;
        deps.sampler = std::make_shared<metrics::Sampler>(io.get_executor(), probe, 10ms);

        runDir = store.createRunDirectory().value();
    }

    ~OrchestratorFixture() {
        guard.reset();
        io.stop();
        runner.join();
    }

    RunResult runAll() {
        Orchestrator orchestrator(config, deps, store, runDir, stop.get_token(), timings);
        auto result = orchestrator.run(endpoints);
        failures = orchestrator.failures();
        return result;
    }

    RunResult reloadFromDisk() const { return store.load(runDir / kResultsFileName).value(); }

    ScratchDir dir;
    ResultStore store;
    boost::asio::io_context io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard;
    std::thread runner;

    config::RunConfiguration config;
    std::vector<discovery::EndpointSpec> endpoints;
    CycleTimings timings;
    std::stop_source stop;
    std::filesystem::path runDir;
    std::vector<CycleFailure> failures;

    std::shared_ptr<test_support::FakeServiceDriver> driver =
        std::make_shared<test_support::FakeServiceDriver>();
    std::shared_ptr<test_support::FakeHttpClient> http =
        std::make_shared<test_support::FakeHttpClient>();
    std::shared_ptr<test_support::FakeLoadSource> load =
        std::make_shared<test_support::FakeLoadSource>();
    std::shared_ptr<test_support::FakeProbe> probe = std::make_shared<test_support::FakeProbe>();
    OrchestratorDeps deps;
};

} // namespace

TEST_CASE_METHOD(OrchestratorFixture, "A full run restarts the service for every test",
                 "[bench][orchestrator]") {
    auto result = runAll();

    CHECK(result.metadata.status == "complete");
    CHECK(result.metadata.completedCycles == 10);
    CHECK(result.metadata.skippedCycles == 0);
    CHECK(result.metadata.cleanRestart);
    CHECK(result.metadata.rates == config.rates);
    CHECK(result.metadata.endpoints ==
          std::vector<std::string>{"read", "write", "cache", "stats", "fib"});
    CHECK(result.recordCount() == 10);

    CHECK(driver->spawnCalls == 10);
    CHECK(driver->terminateCalls == 10);
    CHECK(driver->liveCount() == 0);

    // Rates outer, endpoints inner
    REQUIRE(load->attacks.size() == 10);
    CHECK(load->attacks[0].rate == 100);
    CHECK(load->attacks[0].endpoint == "read");
    CHECK(load->attacks[4].endpoint == "fib");
    CHECK(load->attacks[5].rate == 200);
    CHECK(load->attacks[5].endpoint == "read");
    CHECK(load->attacks[1].method == "POST");
    CHECK(load->attacks[1].url == "http://127.0.0.1:8000/api/db/write/1000");
    CHECK(load->attacks[0].duration == 50ms);

    // Each cycle seeds, then smoke-tests the endpoint
    REQUIRE(http->requests.size() == 20);
    CHECK(http->requests[0] == "POST http://127.0.0.1:8000/api/db/seed");
    CHECK(http->requests[1] == "GET http://127.0.0.1:8000/api/db/read/1000");

    const auto* record = result.find(100, "read");
    REQUIRE(record != nullptr);
    CHECK(record->targetRps == 100);
    CHECK(record->achievedRps == Approx(20000.0));
    CHECK(record->p95Ms == Approx(4.0));
    CHECK(record->avgMs == Approx(3.0));
    CHECK(std::filesystem::exists(runDir / "read_100_cpu.json"));

    auto saved = reloadFromDisk();
    CHECK(saved.metadata.status == "complete");
    CHECK(saved.recordCount() == 10);
}

TEST_CASE_METHOD(OrchestratorFixture, "Interrupting a run keeps completed results",
                 "[bench][orchestrator][interrupt]") {
    load->onAttack = [this](int call) {
        if (call == 3) {
            stop.request_stop();
        }
    };

    auto result = runAll();

    CHECK(result.metadata.status == "interrupted");
    CHECK(result.recordCount() == 2);
    CHECK(result.metadata.completedCycles == 2);
    CHECK(result.find(100, "read") != nullptr);
    CHECK(result.find(100, "write") != nullptr);
    CHECK(result.find(100, "cache") == nullptr);

    // The interrupted cycle still tore its service down and no later cycle started
    CHECK(driver->spawnCalls == 3);
    CHECK(driver->terminateCalls == 3);
    CHECK(driver->liveCount() == 0);

    auto saved = reloadFromDisk();
    CHECK(saved.metadata.status == "interrupted");
    CHECK(saved.recordCount() == 2);
}

TEST_CASE_METHOD(OrchestratorFixture, "A stop before the first cycle runs nothing",
                 "[bench][orchestrator][interrupt]") {
    stop.request_stop();
    auto result = runAll();
    CHECK(result.metadata.status == "interrupted");
    CHECK(result.recordCount() == 0);
    CHECK(driver->spawnCalls == 0);
    CHECK(reloadFromDisk().metadata.endpoints.size() == 5);
}

TEST_CASE_METHOD(OrchestratorFixture, "Failing cycles are skipped and the run continues",
                 "[bench][orchestrator]") {
    SECTION("spawn failure") {
        driver->failSpawnOnCall = 2;
        auto result = runAll();
        CHECK(result.metadata.status == "complete");
        CHECK(result.recordCount() == 9);
        CHECK(result.metadata.skippedCycles == 1);
        CHECK(result.find(100, "write") == nullptr);
        CHECK(driver->terminateCalls == 9);
        REQUIRE(failures.size() == 1);
        CHECK(failures[0].error.code == ErrorCode::SpawnFailed);
        CHECK(failures[0].endpoint == "write");
        CHECK(failures[0].rate == 100);
    }

    SECTION("service never becomes healthy") {
        driver->healthy = false;
        auto result = runAll();
        CHECK(result.metadata.status == "complete");
        CHECK(result.recordCount() == 0);
        CHECK(result.metadata.skippedCycles == 10);
        CHECK(driver->terminateCalls == 10);
        CHECK(load->attackCalls == 0);
        REQUIRE(failures.size() == 10);
        CHECK(failures[0].error.code == ErrorCode::HealthCheckFailed);
    }

    SECTION("seeding fails") {
        http->status = 500;
        auto result = runAll();
        CHECK(result.recordCount() == 0);
        CHECK(http->requests.size() == 10);
        CHECK(driver->liveCount() == 0);
        REQUIRE(failures.size() == 10);
        CHECK(failures[0].error.code == ErrorCode::SeedFailed);
        CHECK(failures[0].error.message.find("HTTP 500") != std::string::npos);
    }

    SECTION("load generator throws") {
        load->onAttack = [](int call) {
            if (call == 1) {
                throw std::runtime_error("vegeta crashed");
            }
        };
        auto result = runAll();
        CHECK(result.recordCount() == 9);
        CHECK(result.find(100, "read") == nullptr);
        CHECK(driver->terminateCalls == 10);
        CHECK(driver->liveCount() == 0);
        REQUIRE(failures.size() == 1);
        CHECK(failures[0].error.code == ErrorCode::InternalError);
        CHECK(failures[0].error.message == "vegeta crashed");
    }
}

TEST_CASE_METHOD(OrchestratorFixture, "Cycle errors after a healthy start leave no record",
                 "[bench][orchestrator]") {
    SECTION("smoke check answers non-2xx after a successful seed") {
        http->statusByPath["/api/db/read/1000"] = 404;
        auto result = runAll();

        CHECK(result.metadata.status == "complete");
        CHECK(result.find(100, "read") == nullptr);
        CHECK(result.find(200, "read") == nullptr);
        CHECK(result.recordCount() == 8);
        CHECK(result.metadata.skippedCycles == 2);
        CHECK(load->attackCalls == 8);
        REQUIRE(failures.size() == 2);
        CHECK(failures[0].error.code == ErrorCode::SmokeCheckFailed);
        CHECK(failures[0].error.message.find("HTTP 404") != std::string::npos);
    }

    SECTION("load generator fails without being cancelled") {
        load->failAttackOnCall = 3;
        auto result = runAll();

        CHECK(result.metadata.status == "complete");
        CHECK(result.find(100, "cache") == nullptr);
        CHECK(result.recordCount() == 9);
        CHECK(result.metadata.skippedCycles == 1);
        CHECK(load->convertCalls == 9);
        REQUIRE(failures.size() == 1);
        CHECK(failures[0].error.code == ErrorCode::LoadGeneratorFailed);
        CHECK(failures[0].endpoint == "cache");
    }

    SECTION("report conversion fails") {
        load->failConvertOnCall = 2;
        auto result = runAll();

        CHECK(result.metadata.status == "complete");
        CHECK(result.find(100, "write") == nullptr);
        CHECK(result.recordCount() == 9);
        CHECK(result.metadata.skippedCycles == 1);
        CHECK_FALSE(std::filesystem::exists(runDir / "write_100_cpu.json"));
        REQUIRE(failures.size() == 1);
        CHECK(failures[0].error.code == ErrorCode::ReportParseError);
    }

    CHECK(driver->terminateCalls == driver->spawnCalls);
    CHECK(driver->liveCount() == 0);
    CHECK(reloadFromDisk().metadata.skippedCycles == failures.size());
}

TEST_CASE_METHOD(OrchestratorFixture,
                 "A throwing load generator does not leave the sampler running",
                 "[bench][orchestrator][sampler]") {
    // Long enough that an abandoned sampling task would still be polling afterwards
    config.duration = 5s;
    load->onAttack = [](int) { throw std::runtime_error("vegeta crashed"); };

    const auto started = std::chrono::steady_clock::now();
    auto result = runAll();
    CHECK(std::chrono::steady_clock::now() - started < 4s);
    CHECK(result.recordCount() == 0);
    CHECK(result.metadata.skippedCycles == 10);

    const int reads = probe->readCount();
    std::this_thread::sleep_for(100ms);
    CHECK(probe->readCount() == reads);
}

TEST_CASE("CycleOutcome names", "[bench][orchestrator]") {
    CHECK(std::string(toString(CycleOutcome::Completed)) == "completed");
    CHECK(std::string(toString(CycleOutcome::Skipped)) == "skipped");
    CHECK(std::string(toString(CycleOutcome::Failed)) == "failed");
    CHECK(std::string(toString(CycleOutcome::Cancelled)) == "cancelled");
}
