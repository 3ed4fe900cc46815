#include <cleanbench/bench/types.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>

namespace cleanbench::bench {

using json = nlohmann::json;

std::size_t RunResult::recordCount() const {
    std::size_t n = 0;
    for (const auto& [rate, byEndpoint] : results) {
        n += byEndpoint.size();
    }
    return n;
}

const TestMetricsRecord* RunResult::find(int rate, const std::string& endpoint) const {
    auto r = results.find(rate);
    if (r == results.end())
        return nullptr;
    auto e = r->second.find(endpoint);
    return e == r->second.end() ? nullptr : &e->second;
}

TestMetricsRecord buildRecord(int targetRate, const loadgen::LoadTestReport& report,
                              const metrics::ResourceSummary& resources, double durationSeconds) {
    TestMetricsRecord record;
    const double success = std::clamp(report.success, 0.0, 1.0);
    const auto requests = std::max<std::int64_t>(report.requests, 0);

    record.targetRps = targetRate;
    record.totalRequests = requests;
    record.successRate = success;
    record.errorRate = 1.0 - success;
    record.achievedRps =
        durationSeconds > 0.0 ? static_cast<double>(requests) * success / durationSeconds : 0.0;

    record.p50Ms = report.p50Ns / 1e6;
    record.p95Ms = report.p95Ns / 1e6;
    record.p99Ms = report.p99Ns / 1e6;
    record.avgMs = report.meanNs / 1e6;

    record.cpuAvg = resources.meanCpu;
    record.cpuMax = resources.peakCpu;
    record.memoryAvgMb = resources.meanMemoryMb;
    record.memoryMaxMb = resources.peakMemoryMb;
    record.sampleCount = resources.sampleCount;
    return record;
}

void to_json(json& j, const TestMetricsRecord& r) {
    j = json{{"achieved_rps", r.achievedRps},   {"target_rps", r.targetRps},
             {"p50_ms", r.p50Ms},               {"p95_ms", r.p95Ms},
             {"p99_ms", r.p99Ms},               {"avg_ms", r.avgMs},
             {"success_rate", r.successRate},   {"error_rate", r.errorRate},
             {"total_requests", r.totalRequests}, {"cpu_avg", r.cpuAvg},
             {"cpu_max", r.cpuMax},             {"memory_avg_mb", r.memoryAvgMb},
             {"memory_max_mb", r.memoryMaxMb},  {"sample_count", r.sampleCount}};
}

void from_json(const json& j, TestMetricsRecord& r) {
    j.at("achieved_rps").get_to(r.achievedRps);
    j.at("target_rps").get_to(r.targetRps);
    j.at("p50_ms").get_to(r.p50Ms);
    j.at("p95_ms").get_to(r.p95Ms);
    r.p99Ms = j.value("p99_ms", 0.0);
    j.at("avg_ms").get_to(r.avgMs);
    j.at("success_rate").get_to(r.successRate);
    r.errorRate = j.value("error_rate", 1.0 - r.successRate);
    r.totalRequests = j.value("total_requests", std::int64_t{0});
    r.cpuAvg = j.value("cpu_avg", 0.0);
    r.cpuMax = j.value("cpu_max", 0.0);
    r.memoryAvgMb = j.value("memory_avg_mb", 0.0);
    r.memoryMaxMb = j.value("memory_max_mb", 0.0);
    r.sampleCount = j.value("sample_count", std::size_t{0});
}

void to_json(json& j, const RunMetadata& m) {
    j = json{{"workers", m.workers},
             {"host", m.host},
             {"port", m.port},
             {"duration", m.duration},
             {"timestamp", m.timestamp},
             {"clean_restart", m.cleanRestart},
             {"status", m.status},
             {"rates", m.rates},
             {"endpoints", m.endpoints},
             {"completed_cycles", m.completedCycles},
             {"skipped_cycles", m.skippedCycles}};
}

void from_json(const json& j, RunMetadata& m) {
    m.workers = j.value("workers", 1);
    m.host = j.value("host", std::string{});
    m.port = j.value("port", 0);
    m.duration = j.value("duration", std::string{});
    m.timestamp = j.value("timestamp", std::string{});
    m.cleanRestart = j.value("clean_restart", true);
    m.status = j.value("status", std::string{"complete"});
    m.rates = j.value("rates", std::vector<int>{});
    m.endpoints = j.value("endpoints", std::vector<std::string>{});
    m.completedCycles = j.value("completed_cycles", std::size_t{0});
    m.skippedCycles = j.value("skipped_cycles", std::size_t{0});
}

void to_json(json& j, const RunResult& r) {
    json results = json::object();
    for (const auto& [rate, byEndpoint] : r.results) {
        json row = json::object();
        for (const auto& [name, record] : byEndpoint) {
            row[name] = record;
        }
        results[std::to_string(rate)] = std::move(row);
    }
    j = json{{"metadata", r.metadata}, {"results", std::move(results)}};
}

void from_json(const json& j, RunResult& r) {
    if (j.contains("metadata")) {
        j.at("metadata").get_to(r.metadata);
    }
    r.results.clear();
    for (const auto& [rateKey, row] : j.at("results").items()) {
        const int rate = std::stoi(rateKey);
        auto& byEndpoint = r.results[rate];
        for (const auto& [name, record] : row.items()) {
            byEndpoint[name] = record.get<TestMetricsRecord>();
        }
    }
}

} // namespace cleanbench::bench

namespace cleanbench::metrics {

void to_json(nlohmann::json& j, const ResourceSample& s) {
    j = nlohmann::json{{"timestamp", s.timestamp}, {"cpu_percent", s.cpuPercent},
                       {"rss_mb", s.rssMb}};
}

void from_json(const nlohmann::json& j, ResourceSample& s) {
    j.at("timestamp").get_to(s.timestamp);
    j.at("cpu_percent").get_to(s.cpuPercent);
    j.at("rss_mb").get_to(s.rssMb);
}

} // namespace cleanbench::metrics
