#include <cleanbench/bench/result_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <optional>
#include <ostream>
#include <set>

namespace cleanbench::bench {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string run_stamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

} // namespace

ResultStore::ResultStore(std::vector<fs::path> roots) : roots_(std::move(roots)) {
    if (roots_.empty()) {
        roots_.emplace_back(".tmp");
    }
}

Result<fs::path> ResultStore::createRunDirectory() const {
    const auto base = roots_.front() / (std::string(kRunDirPrefix) + run_stamp());
    auto dir = base;
    std::error_code ec;
    // Two runs started within the same second get distinct directories
    for (int n = 1; fs::exists(dir, ec); ++n) {
        dir = base;
        dir += "_" + std::to_string(n);
    }
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "Cannot create output directory " + dir.string() + ": " + ec.message()};
    }
    return dir;
}

Result<void> ResultStore::persist(const RunResult& result, const fs::path& runDir) const {
    const auto path = runDir / kResultsFileName;
    auto tempPath = path;
    tempPath += ".tmp";

    {
        std::ofstream ofs(tempPath, std::ios::trunc);
        if (!ofs) {
            return Error{ErrorCode::WriteError, "Cannot open " + tempPath.string()};
        }
        ofs << json(result).dump(2);
        ofs.close();
        if (!ofs) {
            return Error{ErrorCode::WriteError, "Failed writing " + tempPath.string()};
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return Error{ErrorCode::WriteError, "Cannot replace " + path.string()};
    }
    spdlog::debug("Persisted {} record(s) to {}", result.recordCount(), path.string());
    return Result<void>();
}

Result<RunResult> ResultStore::load(const fs::path& resultsFile) const {
    std::ifstream in(resultsFile);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Results file not found: " + resultsFile.string()};
    }
    try {
        return json::parse(in).get<RunResult>();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidData, resultsFile.string() + ": " + e.what()};
    }
}

Result<fs::path> ResultStore::findLatest() const {
    std::optional<fs::path> best;
    fs::file_time_type bestTime{};

    for (const auto& root : roots_) {
        std::error_code ec;
        if (!fs::is_directory(root, ec))
            continue;
        for (const auto& entry : fs::directory_iterator(root, ec)) {
            if (!entry.is_directory(ec))
                continue;
            if (entry.path().filename().string().rfind(kRunDirPrefix, 0) != 0)
                continue;
            auto candidate = entry.path() / kResultsFileName;
            auto mtime = fs::last_write_time(candidate, ec);
            if (ec)
                continue;
            if (!best || mtime > bestTime) {
                best = candidate;
                bestTime = mtime;
            }
        }
    }

    if (!best) {
        return Error{ErrorCode::NotFound, "No benchmark results found"};
    }
    return *best;
}

Result<RunResult> ResultStore::loadLatest() const {
    auto latest = findLatest();
    if (!latest) {
        return latest.error();
    }
    spdlog::debug("Loading latest results from {}", latest.value().string());
    return load(latest.value());
}

Result<void> ResultStore::writeSeries(const metrics::ResourceSeries& series, const fs::path& file) {
    std::ofstream ofs(file, std::ios::trunc);
    if (!ofs) {
        return Error{ErrorCode::WriteError, "Cannot open " + file.string()};
    }
    ofs << json(series).dump(2);
    if (!ofs) {
        return Error{ErrorCode::WriteError, "Failed writing " + file.string()};
    }
    return Result<void>();
}

std::vector<std::string> endpointOrder(const RunResult& result) {
    std::vector<std::string> order;
    std::set<std::string> seen;
    for (const auto& name : result.metadata.endpoints) {
        if (seen.insert(name).second)
            order.push_back(name);
    }
    for (const auto& [rate, byEndpoint] : result.results) {
        for (const auto& [name, record] : byEndpoint) {
            if (seen.insert(name).second)
                order.push_back(name);
        }
    }
    return order;
}

std::vector<EndpointRollup> summarize(const RunResult& result) {
    std::vector<EndpointRollup> rollups;
    for (const auto& name : endpointOrder(result)) {
        EndpointRollup rollup;
        rollup.endpoint = name;
        double cpuTotal = 0.0;
        double p95Total = 0.0;
        for (const auto& [rate, byEndpoint] : result.results) {
            auto it = byEndpoint.find(name);
            if (it == byEndpoint.end())
                continue;
            const auto& r = it->second;
            if (r.successRate > 0.95) {
                rollup.sustainableRps = std::max(rollup.sustainableRps, r.achievedRps);
            }
            cpuTotal += r.cpuAvg;
            p95Total += r.p95Ms;
            rollup.maxCpu = std::max(rollup.maxCpu, r.cpuAvg);
            rollup.maxP95Ms = std::max(rollup.maxP95Ms, r.p95Ms);
            ++rollup.ratePoints;
        }
        if (rollup.ratePoints > 0) {
            rollup.meanCpu = cpuTotal / static_cast<double>(rollup.ratePoints);
            rollup.meanP95Ms = p95Total / static_cast<double>(rollup.ratePoints);
        }
        rollups.push_back(std::move(rollup));
    }
    return rollups;
}

void renderTables(const RunResult& result, std::ostream& out) {
    out << "\n" << std::string(100, '=') << "\n";
    out << "CLEAN BENCHMARK RESULTS\n";
    out << std::string(100, '=') << "\n";

    const auto order = endpointOrder(result);
    for (const auto& [rate, byEndpoint] : result.results) {
        out << fmt::format("\nRate {} RPS:\n", rate);

        size_t longest = 0;
        for (const auto& [name, record] : byEndpoint)
            longest = std::max(longest, name.size());
        const size_t width = std::max<size_t>(25, longest + 2);

        out << fmt::format("{:<{}} {:<6} {:<8} {:<8} {:<8} {:<8} {:<8} {:<8}\n", "Endpoint", width,
                           "Target", "Achieved", "P50(ms)", "Avg(ms)", "P95(ms)", "Success%",
                           "CPU Avg%");
        out << std::string(width + 6 + 8 * 7, '-') << "\n";

        for (const auto& name : order) {
            auto it = byEndpoint.find(name);
            if (it == byEndpoint.end())
                continue;
            const auto& m = it->second;
            out << fmt::format("{:<{}} {:<6} {:<8.1f} {:<8.1f} {:<8.1f} {:<8.1f} {:<8.1f} {:<8.1f}\n",
                               name, width, m.targetRps, m.achievedRps, m.p50Ms, m.avgMs, m.p95Ms,
                               m.successRate * 100.0, m.cpuAvg);
        }
    }
}

void renderAnalysis(const std::vector<EndpointRollup>& rollups, std::ostream& out) {
    out << "\n" << std::string(80, '=') << "\n";
    out << "PERFORMANCE ANALYSIS\n";
    out << std::string(80, '=') << "\n";

    out << "Maximum Sustainable RPS (Success Rate > 95%):\n";
    for (const auto& r : rollups) {
        out << fmt::format("  {:<25}: {:.1f} RPS\n", r.endpoint, r.sustainableRps);
    }

    const bool anyCpu = std::any_of(rollups.begin(), rollups.end(),
                                    [](const EndpointRollup& r) { return r.maxCpu > 0.0; });
    if (anyCpu) {
        out << "\nCPU Usage Analysis:\n";
        for (const auto& r : rollups) {
            if (r.ratePoints == 0)
                continue;
            out << fmt::format("  {:<25}: {:.1f}% avg, {:.1f}% max\n", r.endpoint, r.meanCpu,
                               r.maxCpu);
        }
    }

    out << "\nLatency Analysis (P95):\n";
    for (const auto& r : rollups) {
        if (r.ratePoints == 0)
            continue;
        out << fmt::format("  {:<25}: {:.1f}ms avg, {:.1f}ms max\n", r.endpoint, r.meanP95Ms,
                           r.maxP95Ms);
    }
}

} // namespace cleanbench::bench
