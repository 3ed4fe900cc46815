#pragma once

#include <cleanbench/bench/result_store.h>
#include <cleanbench/bench/types.h>
#include <cleanbench/config/run_config.h>
#include <cleanbench/discovery/endpoint_discovery.h>
#include <cleanbench/loadgen/load_source.h>
#include <cleanbench/metrics/sampler.h>
#include <cleanbench/net/http_client.h>
#include <cleanbench/process/lifecycle_manager.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace cleanbench::bench {

/**
 * @brief Fixed waits of the clean-room cycle
 */
struct CycleTimings {
    std::chrono::milliseconds healthTimeout{std::chrono::seconds{30}};
    std::chrono::milliseconds seedTimeout{std::chrono::seconds{10}};
    std::chrono::milliseconds seedSettle{std::chrono::seconds{1}};
    std::chrono::milliseconds smokeTimeout{std::chrono::seconds{5}};
    std::chrono::milliseconds stabilization{std::chrono::seconds{2}};
    std::chrono::milliseconds samplerSlack{std::chrono::seconds{2}};
    std::chrono::milliseconds interCycle{std::chrono::seconds{2}};
};

enum class CycleOutcome { Completed, Skipped, Failed, Cancelled };

const char* toString(CycleOutcome outcome) noexcept;

// Why a cycle produced no record
struct CycleFailure {
    int rate{0};
    std::string endpoint;
    Error error;
};

struct OrchestratorDeps {
    std::shared_ptr<process::IServiceDriver> driver;
    std::shared_ptr<net::IHttpClient> http;
    std::shared_ptr<loadgen::ILoadSource> load;
    std::shared_ptr<metrics::Sampler> sampler;
};

/**
 * @brief Runs one clean-room cycle per (rate, endpoint), rates outer and endpoints inner
 *
 * Every cycle starts a fresh service instance and always tears it down. A failing cycle is
 * logged and skipped; the run carries on. The result document is rewritten after every
 * cycle, so an interrupted run leaves a valid partial artifact.
 */
class Orchestrator {
public:
    Orchestrator(config::RunConfiguration config, OrchestratorDeps deps, ResultStore store,
                 std::filesystem::path runDir, std::stop_token stop, CycleTimings timings = {});

    RunResult run(const std::vector<discovery::EndpointSpec>& endpoints);

    const RunResult& result() const noexcept { return result_; }
    const std::vector<CycleFailure>& failures() const noexcept { return failures_; }
    const std::filesystem::path& runDirectory() const noexcept { return runDir_; }

private:
    CycleOutcome runCycle(int rate, const discovery::EndpointSpec& endpoint);
    CycleOutcome executeCycle(int rate, const discovery::EndpointSpec& endpoint,
                              const process::ServiceInstance& instance);
    CycleOutcome measure(int rate, const discovery::EndpointSpec& endpoint,
                         const process::ServiceInstance& instance);

    // Transport errors and non-2xx statuses both map to `failure`
    Result<void> expectSuccess(const std::string& method, const std::string& url,
                               std::chrono::milliseconds timeout, ErrorCode failure);
    CycleOutcome recordFailure(int rate, const discovery::EndpointSpec& endpoint, Error error);

    // Interruptible sleep; false if a stop was requested
    bool pause(std::chrono::milliseconds duration);
    void persist();

    config::RunConfiguration config_;
    OrchestratorDeps deps_;
    ResultStore store_;
    std::filesystem::path runDir_;
    std::stop_token stop_;
    CycleTimings timings_;
    RunResult result_;
    std::vector<CycleFailure> failures_;
};

// Local time of now as YYYY-mm-ddTHH:MM:SS
std::string isoTimestamp();

} // namespace cleanbench::bench
