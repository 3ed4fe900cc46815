#pragma once

#include <cleanbench/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>

namespace cleanbench::loadgen {

/**
 * @brief Parsed load generator report for one attack (latencies in nanoseconds)
 */
struct LoadTestReport {
    std::int64_t requests{0};
    double success{0.0};
    double rate{0.0};
    double p50Ns{0.0};
    double p95Ns{0.0};
    double p99Ns{0.0};
    double meanNs{0.0};
};

// Parse a vegeta `report -type=json` document
Result<LoadTestReport> parseLoadTestReport(const std::string& jsonText);

struct AttackRequest {
    std::string endpoint; ///< Logical name, used for artifact file names
    std::string method;
    std::string url;
    int rate{0};
    std::chrono::milliseconds duration{0};
    std::filesystem::path artifactDir;
};

/**
 * @brief Drives load against one URL and converts the raw result
 *
 * attack() blocks for the attack duration and returns the raw artifact path; convert() turns
 * that artifact into a LoadTestReport. Stopping the token aborts an attack in progress
 * with OperationCancelled.
 */
class ILoadSource {
public:
    virtual ~ILoadSource() = default;

    virtual Result<std::filesystem::path> attack(const AttackRequest& request,
                                                 std::stop_token stop) = 0;

    virtual Result<LoadTestReport> convert(const std::filesystem::path& artifact) = 0;
};

/**
 * vegeta CLI driver: writes t_<endpoint>.txt, runs `vegeta attack` into
 * <endpoint>_<rate>.bin and `vegeta report -type=json` into <endpoint>_<rate>.json.
 */
class VegetaLoadSource final : public ILoadSource {
public:
    explicit VegetaLoadSource(std::string binary = "vegeta",
                              std::chrono::milliseconds requestTimeout = std::chrono::seconds{10});

    Result<std::filesystem::path> attack(const AttackRequest& request,
                                         std::stop_token stop) override;
    Result<LoadTestReport> convert(const std::filesystem::path& artifact) override;

private:
    std::string binary_;
    std::chrono::milliseconds requestTimeout_;
};

// Format a duration the way vegeta flags expect it ("10s", "1500ms")
std::string formatGoDuration(std::chrono::milliseconds d);

} // namespace cleanbench::loadgen
