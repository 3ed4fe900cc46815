#include <cleanbench/loadgen/load_source.h>
#include <cleanbench/process/command_runner.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

namespace cleanbench::loadgen {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Time allowed beyond the attack duration for vegeta to drain in-flight requests
constexpr auto kAttackOverhead = std::chrono::seconds{30};
constexpr auto kReportTimeout = std::chrono::seconds{60};

std::string artifact_stem(const AttackRequest& request) {
    return request.endpoint + "_" + std::to_string(request.rate);
}

Error command_error(const std::string& what, const process::CommandOutcome& outcome) {
    std::string message = what + " exited with code " + std::to_string(outcome.exitCode);
    if (outcome.timedOut)
        message = what + " timed out";
    if (!outcome.stderrText.empty())
        message += ": " + outcome.stderrText;
    return Error{ErrorCode::LoadGeneratorFailed, message};
}

} // namespace

std::string formatGoDuration(std::chrono::milliseconds d) {
    if (d.count() % 1000 == 0) {
        return std::to_string(d.count() / 1000) + "s";
    }
    return std::to_string(d.count()) + "ms";
}

Result<LoadTestReport> parseLoadTestReport(const std::string& jsonText) {
    try {
        auto doc = json::parse(jsonText);
        LoadTestReport report;
        report.requests = doc.at("requests").get<std::int64_t>();
        report.success = doc.at("success").get<double>();
        report.rate = doc.value("rate", 0.0);
        const auto& latencies = doc.at("latencies");
        report.p50Ns = latencies.at("50th").get<double>();
        report.p95Ns = latencies.at("95th").get<double>();
        report.p99Ns = latencies.at("99th").get<double>();
        report.meanNs = latencies.at("mean").get<double>();
        return report;
    } catch (const json::exception& e) {
        return Error{ErrorCode::ReportParseError, std::string("Invalid load report: ") + e.what()};
    }
}

VegetaLoadSource::VegetaLoadSource(std::string binary, std::chrono::milliseconds requestTimeout)
    : binary_(std::move(binary)), requestTimeout_(requestTimeout) {}

Result<fs::path> VegetaLoadSource::attack(const AttackRequest& request, std::stop_token stop) {
    const auto targets = request.artifactDir / ("t_" + request.endpoint + ".txt");
    {
        std::ofstream out(targets, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Cannot write target file " + targets.string()};
        }
        out << request.method << " " << request.url << "\n";
    }

    const auto artifact = request.artifactDir / (artifact_stem(request) + ".bin");

    process::ServiceProcessConfig cmd;
    cmd.executable = binary_;
    cmd.args = {"attack",
                "-duration", formatGoDuration(request.duration),
                "-rate", std::to_string(request.rate),
                "-timeout", formatGoDuration(requestTimeout_),
                "-targets", targets.string()};
    cmd.stdout_to(artifact);

    spdlog::debug("Load generator: {} {} at {} RPS for {}", request.method, request.url,
                  request.rate, formatGoDuration(request.duration));

    auto outcome = process::runToCompletion(std::move(cmd), request.duration + kAttackOverhead,
                                            std::move(stop));
    if (!outcome) {
        return Error{ErrorCode::LoadGeneratorFailed,
                     "Cannot run " + binary_ + ": " + outcome.error().message};
    }
    if (outcome.value().cancelled) {
        return Error{ErrorCode::OperationCancelled, "Attack cancelled"};
    }
    if (!outcome.value().succeeded()) {
        return command_error(binary_ + " attack", outcome.value());
    }
    return artifact;
}

Result<LoadTestReport> VegetaLoadSource::convert(const fs::path& artifact) {
    auto reportPath = artifact;
    reportPath.replace_extension(".json");

    process::ServiceProcessConfig cmd;
    cmd.executable = binary_;
    cmd.args = {"report", "-type=json", artifact.string()};
    cmd.stdout_to(reportPath);

    auto outcome = process::runToCompletion(std::move(cmd), kReportTimeout);
    if (!outcome) {
        return Error{ErrorCode::LoadGeneratorFailed,
                     "Cannot run " + binary_ + ": " + outcome.error().message};
    }
    if (!outcome.value().succeeded()) {
        return command_error(binary_ + " report", outcome.value());
    }

    std::ifstream in(reportPath);
    if (!in) {
        return Error{ErrorCode::ReportParseError, "Missing report " + reportPath.string()};
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    return parseLoadTestReport(text);
}

} // namespace cleanbench::loadgen
