#include <cleanbench/bench/orchestrator.h>

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <ctime>
#include <exception>
#include <mutex>

namespace cleanbench::bench {

const char* toString(CycleOutcome outcome) noexcept {
    switch (outcome) {
        case CycleOutcome::Completed:
            return "completed";
        case CycleOutcome::Skipped:
            return "skipped";
        case CycleOutcome::Failed:
            return "failed";
        case CycleOutcome::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::string isoTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

Orchestrator::Orchestrator(config::RunConfiguration config, OrchestratorDeps deps,
                           ResultStore store, std::filesystem::path runDir, std::stop_token stop,
                           CycleTimings timings)
    : config_(std::move(config)), deps_(std::move(deps)), store_(std::move(store)),
      runDir_(std::move(runDir)), stop_(std::move(stop)), timings_(timings) {}

RunResult Orchestrator::run(const std::vector<discovery::EndpointSpec>& endpoints) {
    auto& meta = result_.metadata;
    meta.workers = config_.workers;
    meta.host = config_.host;
    meta.port = config_.port;
    meta.duration = config_.durationText;
    meta.timestamp = isoTimestamp();
    meta.cleanRestart = true;
    meta.status = "running";
    meta.rates = config_.rates;
    meta.endpoints.clear();
    for (const auto& e : endpoints) {
        meta.endpoints.push_back(e.name);
    }
    persist();

    const size_t total = config_.rates.size() * endpoints.size();
    size_t current = 0;
    bool interrupted = false;
    spdlog::info("Running {} tests with clean service restarts", total);

    for (int rate : config_.rates) {
        for (const auto& endpoint : endpoints) {
            if (stop_.stop_requested()) {
                interrupted = true;
                break;
            }
            ++current;
            spdlog::info("Test {}/{}: {} at {} RPS", current, total, endpoint.name, rate);

            auto outcome = runCycle(rate, endpoint);
            switch (outcome) {
                case CycleOutcome::Completed:
                    ++meta.completedCycles;
                    break;
                case CycleOutcome::Skipped:
                case CycleOutcome::Failed:
                    ++meta.skippedCycles;
                    break;
                case CycleOutcome::Cancelled:
                    interrupted = true;
                    break;
            }
            persist();

            if (interrupted)
                break;
            if (current < total && !pause(timings_.interCycle)) {
                interrupted = true;
                break;
            }
        }
        if (interrupted)
            break;
    }

    meta.status = interrupted ? "interrupted" : "complete";
    persist();
    if (interrupted) {
        spdlog::warn("Run interrupted after {} completed test(s)", meta.completedCycles);
    }
    return result_;
}

CycleOutcome Orchestrator::runCycle(int rate, const discovery::EndpointSpec& endpoint) {
    spdlog::info("  Starting fresh service...");
    auto spawned = deps_.driver->spawn(config_);
    if (!spawned) {
        recordFailure(rate, endpoint, spawned.error());
        return CycleOutcome::Skipped;
    }
    const auto instance = spawned.value();

    CycleOutcome outcome = CycleOutcome::Failed;
    try {
        outcome = executeCycle(rate, endpoint, instance);
    } catch (const std::exception& e) {
        recordFailure(rate, endpoint, Error{ErrorCode::InternalError, e.what()});
        outcome = CycleOutcome::Failed;
    }

    spdlog::info("  Stopping service...");
    deps_.driver->terminate(instance);
    if (outcome != CycleOutcome::Completed && outcome != CycleOutcome::Cancelled) {
        spdlog::warn("  {} at {} RPS {}", endpoint.name, rate, toString(outcome));
    }
    return outcome;
}

CycleOutcome Orchestrator::executeCycle(int rate, const discovery::EndpointSpec& endpoint,
                                        const process::ServiceInstance& instance) {
    const auto base = instance.baseUrl();

    spdlog::info("  Waiting for service...");
    if (!deps_.driver->awaitHealthy(instance, timings_.healthTimeout)) {
        if (stop_.stop_requested())
            return CycleOutcome::Cancelled;
        return recordFailure(rate, endpoint,
                             Error{ErrorCode::HealthCheckFailed,
                                   "Service failed to become healthy within " +
                                       std::to_string(timings_.healthTimeout.count()) + "ms"});
    }
    spdlog::info("  Service is ready");
    if (stop_.stop_requested())
        return CycleOutcome::Cancelled;

    spdlog::info("  Seeding data...");
    if (auto seeded = expectSuccess("POST", base + config_.server.seedPath, timings_.seedTimeout,
                                    ErrorCode::SeedFailed);
        !seeded) {
        return recordFailure(rate, endpoint, seeded.error());
    }
    if (!pause(timings_.seedSettle))
        return CycleOutcome::Cancelled;

    spdlog::info("  Testing endpoint...");
    const auto url = discovery::materializeUrl(base, endpoint.pathTemplate, config_.server.resourceId);
    if (auto smoke = expectSuccess(endpoint.method, url, timings_.smokeTimeout,
                                   ErrorCode::SmokeCheckFailed);
        !smoke) {
        return recordFailure(rate, endpoint, smoke.error());
    }

    if (!pause(timings_.stabilization))
        return CycleOutcome::Cancelled;

    return measure(rate, endpoint, instance);
}

namespace {

// Stops and joins the sampling task on every exit path unless the series was collected
class SamplingScope {
public:
    SamplingScope(metrics::Sampler& sampler, metrics::SamplingHandle handle)
        : sampler_(sampler), handle_(std::move(handle)) {}
    ~SamplingScope() {
        if (!collected_) {
            sampler_.stop(handle_);
            (void)sampler_.collect(handle_);
        }
    }

    SamplingScope(const SamplingScope&) = delete;
    SamplingScope& operator=(const SamplingScope&) = delete;

    void stop() { sampler_.stop(handle_); }

    metrics::ResourceSeries collect() {
        collected_ = true;
        return sampler_.collect(handle_);
    }

private:
    metrics::Sampler& sampler_;
    metrics::SamplingHandle handle_;
    bool collected_{false};
};

} // namespace

CycleOutcome Orchestrator::measure(int rate, const discovery::EndpointSpec& endpoint,
                                   const process::ServiceInstance& instance) {
    SamplingScope sampling(*deps_.sampler,
                           deps_.sampler->startSampling(instance.pid,
                                                        config_.duration + timings_.samplerSlack));
    std::stop_callback stopSampling(stop_, [&] { sampling.stop(); });

    loadgen::AttackRequest request{
        endpoint.name,
        endpoint.method,
        discovery::materializeUrl(instance.baseUrl(), endpoint.pathTemplate,
                                  config_.server.resourceId),
        rate,
        config_.duration,
        runDir_,
    };

    spdlog::info("  Running load test...");
    auto artifact = deps_.load->attack(request, stop_);
    if (!artifact) {
        if (artifact.error().code == ErrorCode::OperationCancelled || stop_.stop_requested()) {
            return CycleOutcome::Cancelled;
        }
        return recordFailure(rate, endpoint, artifact.error());
    }

    spdlog::info("  Generating report...");
    auto report = deps_.load->convert(artifact.value());
    auto series = sampling.collect();
    if (!report) {
        return recordFailure(rate, endpoint, report.error());
    }

    auto seriesFile = runDir_ / (endpoint.name + "_" + std::to_string(rate) + "_cpu.json");
    if (auto written = ResultStore::writeSeries(series, seriesFile); !written) {
        spdlog::warn("  {}", written.error().message);
    }

    const auto summary = metrics::Sampler::summarize(series);
    const auto record =
        buildRecord(rate, report.value(), summary, config_.durationSeconds());
    spdlog::debug("    Target={}, generator rate={:.1f}, success={:.1f}%, requests={}, "
                  "achieved={:.1f}",
                  rate, report.value().rate, record.successRate * 100.0, record.totalRequests,
                  record.achievedRps);

    result_.results[rate][endpoint.name] = record;
    spdlog::info("  Completed - achieved {:.1f} RPS, CPU: {:.1f}% avg", record.achievedRps,
                 record.cpuAvg);
    return CycleOutcome::Completed;
}

Result<void> Orchestrator::expectSuccess(const std::string& method, const std::string& url,
                                         std::chrono::milliseconds timeout, ErrorCode failure) {
    auto response = deps_.http->request(method, url, timeout);
    if (!response) {
        return Error{failure, method + " " + url + ": " + response.error().message};
    }
    if (!response.value().ok()) {
        return Error{failure,
                     method + " " + url + ": HTTP " + std::to_string(response.value().status)};
    }
    spdlog::debug("  {} {} -> {}", method, url, response.value().status);
    return Result<void>();
}

CycleOutcome Orchestrator::recordFailure(int rate, const discovery::EndpointSpec& endpoint,
                                         Error error) {
    spdlog::warn("  {}: {}", errorToString(error.code), error.message);
    const auto outcome =
        error.code == ErrorCode::SpawnFailed ? CycleOutcome::Skipped : CycleOutcome::Failed;
    failures_.push_back(CycleFailure{rate, endpoint.name, std::move(error)});
    return outcome;
}

bool Orchestrator::pause(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return !stop_.stop_requested();
    }
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop_, duration, [] { return false; });
    return !stop_.stop_requested();
}

void Orchestrator::persist() {
    if (auto saved = store_.persist(result_, runDir_); !saved) {
        spdlog::error("Failed to persist results: {}", saved.error().message);
    }
}

} // namespace cleanbench::bench
