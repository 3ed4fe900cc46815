#pragma once

#include <cleanbench/bench/types.h>
#include <cleanbench/core/types.h>

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace cleanbench::bench {

inline constexpr const char* kResultsFileName = "clean_results.json";
inline constexpr const char* kRunDirPrefix = "clean_bench_";

/**
 * @brief Per-endpoint view across all tested rates
 */
struct EndpointRollup {
    std::string endpoint;
    double sustainableRps{0.0}; ///< Max achieved RPS among points with success rate > 0.95
    double meanCpu{0.0};
    double maxCpu{0.0};
    double meanP95Ms{0.0};
    double maxP95Ms{0.0};
    std::size_t ratePoints{0};
};

/**
 * @brief Reads and writes run artifacts under one or more output roots
 */
class ResultStore {
public:
    explicit ResultStore(std::vector<std::filesystem::path> roots = {".tmp"});

    // <root>/clean_bench_<YYYYmmdd_HHMMSS>, created on demand (first root)
    Result<std::filesystem::path> createRunDirectory() const;

    // Atomic replace of <runDir>/clean_results.json
    Result<void> persist(const RunResult& result, const std::filesystem::path& runDir) const;

    Result<RunResult> load(const std::filesystem::path& resultsFile) const;

    // Newest clean_bench_*/clean_results.json across all roots, by modification time
    Result<std::filesystem::path> findLatest() const;
    Result<RunResult> loadLatest() const;

    static Result<void> writeSeries(const metrics::ResourceSeries& series,
                                    const std::filesystem::path& file);

    const std::vector<std::filesystem::path>& roots() const noexcept { return roots_; }

private:
    std::vector<std::filesystem::path> roots_;
};

// Endpoints in metadata order, then any others found in the results
std::vector<std::string> endpointOrder(const RunResult& result);

std::vector<EndpointRollup> summarize(const RunResult& result);

void renderTables(const RunResult& result, std::ostream& out);
void renderAnalysis(const std::vector<EndpointRollup>& rollups, std::ostream& out);

} // namespace cleanbench::bench
