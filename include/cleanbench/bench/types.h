#pragma once

#include <cleanbench/loadgen/load_source.h>
#include <cleanbench/metrics/sampler.h>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cleanbench::bench {

/**
 * @brief Measurements for one (rate, endpoint) cycle
 */
struct TestMetricsRecord {
    double achievedRps{0.0};
    int targetRps{0};
    double p50Ms{0.0};
    double p95Ms{0.0};
    double p99Ms{0.0};
    double avgMs{0.0};
    double successRate{0.0};
    double errorRate{0.0};
    std::int64_t totalRequests{0};
    double cpuAvg{0.0};
    double cpuMax{0.0};
    double memoryAvgMb{0.0};
    double memoryMaxMb{0.0};
    std::size_t sampleCount{0};
};

struct RunMetadata {
    int workers{1};
    std::string host;
    int port{0};
    std::string duration; ///< Textual form, e.g. "10s"
    std::string timestamp; ///< ISO-8601 local time of run start
    bool cleanRestart{true};
    std::string status{"running"}; ///< running | complete | interrupted
    std::vector<int> rates;
    std::vector<std::string> endpoints;
    std::size_t completedCycles{0};
    std::size_t skippedCycles{0};
};

/**
 * @brief Whole-run result: rate -> endpoint name -> record
 */
struct RunResult {
    RunMetadata metadata;
    std::map<int, std::map<std::string, TestMetricsRecord>> results;

    std::size_t recordCount() const;
    const TestMetricsRecord* find(int rate, const std::string& endpoint) const;
};

/**
 * Combine one load report and resource summary into a record.
 *
 * achievedRps = requests x success / durationSeconds, independent of the generator's own rate.
 */
TestMetricsRecord buildRecord(int targetRate, const loadgen::LoadTestReport& report,
                              const metrics::ResourceSummary& resources, double durationSeconds);

void to_json(nlohmann::json& j, const TestMetricsRecord& r);
void from_json(const nlohmann::json& j, TestMetricsRecord& r);
void to_json(nlohmann::json& j, const RunMetadata& m);
void from_json(const nlohmann::json& j, RunMetadata& m);
void to_json(nlohmann::json& j, const RunResult& r);
void from_json(const nlohmann::json& j, RunResult& r);

} // namespace cleanbench::bench

namespace cleanbench::metrics {
void to_json(nlohmann::json& j, const ResourceSample& s);
void from_json(const nlohmann::json& j, ResourceSample& s);
} // namespace cleanbench::metrics
