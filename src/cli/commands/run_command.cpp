#include <cleanbench/bench/orchestrator.h>
#include <cleanbench/bench/result_store.h>
#include <cleanbench/cli/bench_cli.h>
#include <cleanbench/cli/command.h>
#include <cleanbench/discovery/endpoint_discovery.h>
#include <cleanbench/loadgen/load_source.h>
#include <cleanbench/metrics/process_probe.h>
#include <cleanbench/metrics/sampler.h>
#include <cleanbench/net/http_client.h>
#include <cleanbench/process/lifecycle_manager.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>

namespace cleanbench::cli {

class RunCommand : public ICommand {
public:
    std::string getName() const override { return "run"; }

    std::string getDescription() const override {
        return "Benchmark every endpoint at every rate, restarting the service for each test";
    }

    void registerCommand(CLI::App& app, BenchCli* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());

        rateOpt_ = cmd->add_option("--rates", rates_, "Target rates in RPS (comma separated)")
                       ->delimiter(',');
        hostOpt_ = cmd->add_option("--host", host_, "Service host");
        portOpt_ = cmd->add_option("--port", port_, "Service port")->check(CLI::Range(1, 65535));
        cmd->add_option("--duration", duration_, "Duration of each load test (e.g. 10s)");
        workersOpt_ = cmd->add_option("--workers", workers_, "Service worker processes")
                          ->check(CLI::PositiveNumber);
        cmd->add_option("--filter", filter_,
                        "Only benchmark endpoints whose path starts with this prefix");
        cmd->add_option("--routes", routes_, "Route manifest (routes.json or OpenAPI document)");
        cmd->add_option("--server-cmd", serverCmd_,
                        "Service command template with {host}, {port} and {workers}");
        cmd->add_option("--seed-path", seedPath_, "Seed endpoint path");
        cmd->add_option("--output-root", outputRoot_, "Directory for run artifacts");
        cmd->add_option("--loadgen", loadgen_, "Load generator binary");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto loaded = cli_->loadConfiguration();
        if (!loaded) {
            return loaded.error();
        }
        auto config = loaded.value();
        if (auto applied = applyOverrides(config); !applied) {
            return applied;
        }
        if (auto valid = config::validateRunConfiguration(config); !valid) {
            return valid;
        }

        printHeader(config);

        std::cout << "Discovering benchmark endpoints...\n";
        if (config.filterPrefix) {
            std::cout << "   Filtering by path prefix: " << *config.filterPrefix << "\n";
        }
        discovery::EndpointDiscovery discovery(
            std::make_shared<discovery::ManifestRouteSource>(config.routesPath),
            config.server.seedPath);
        auto endpoints = discovery.discover(config.filterPrefix);
        if (!endpoints) {
            return endpoints.error();
        }
        if (endpoints.value().empty()) {
            return Error{ErrorCode::DiscoveryFailed, "No benchmark endpoints found"};
        }
        std::cout << "Found " << endpoints.value().size() << " endpoints:";
        for (const auto& e : endpoints.value()) {
            std::cout << " " << e.name;
        }
        std::cout << "\n";

        bench::ResultStore store(std::vector<std::filesystem::path>{config.outputRoot});
        auto runDir = store.createRunDirectory();
        if (!runDir) {
            return runDir.error();
        }
        std::cout << "Output: " << runDir.value().string() << "\n";
        cli_->attachRunLog(runDir.value());

        auto http = net::makeCurlHttpClient();
        auto manager = std::make_shared<process::ProcessLifecycleManager>(
            http, process::LifecycleOptions::fromConfig(config));
        cli_->registerDriver(manager);

        // A service left over from an earlier crashed run would hold the port
        manager->sweepOrphans();

        bench::OrchestratorDeps deps;
        deps.driver = manager;
        deps.http = http;
        deps.load = std::make_shared<loadgen::VegetaLoadSource>(config.loadgen.binary,
                                                                config.loadgen.requestTimeout);
        deps.sampler = std::make_shared<metrics::Sampler>(
            cli_->executor(), std::make_shared<metrics::ProcfsProbe>());

        const auto started = std::chrono::steady_clock::now();
        bench::Orchestrator orchestrator(config, deps, store, runDir.value(), cli_->stopToken());
        auto result = orchestrator.run(endpoints.value());

        cli_->shutdown().shutdown();

        bench::renderTables(result, std::cout);
        std::cout << "\nResults saved: "
                  << (runDir.value() / bench::kResultsFileName).string() << "\n";
        bench::renderAnalysis(bench::summarize(result), std::cout);

        const double elapsed =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        std::cout << fmt::format("\nClean benchmark {} in {:.1f}s\n",
                                 result.metadata.status == "complete" ? "completed"
                                                                      : "interrupted",
                                 elapsed);
        std::cout << "Results directory: " << runDir.value().string() << "\n";
        return Result<void>();
    }

private:
    Result<void> applyOverrides(config::RunConfiguration& config) const {
        if (rateOpt_->count() > 0)
            config.rates = rates_;
        if (hostOpt_->count() > 0)
            config.host = host_;
        if (portOpt_->count() > 0)
            config.port = port_;
        if (workersOpt_->count() > 0)
            config.workers = workers_;
        if (!duration_.empty()) {
            if (auto r = config::setDuration(config, duration_); !r)
                return r;
        }
        if (!filter_.empty())
            config.filterPrefix = filter_;
        if (!routes_.empty())
            config.routesPath = routes_;
        if (!serverCmd_.empty())
            config.server.commandTemplate = serverCmd_;
        if (!seedPath_.empty())
            config.server.seedPath = seedPath_;
        if (!outputRoot_.empty())
            config.outputRoot = outputRoot_;
        if (!loadgen_.empty())
            config.loadgen.binary = loadgen_;
        return Result<void>();
    }

    static void printHeader(const config::RunConfiguration& config) {
        std::cout << "Clean Benchmark (service restart between tests)\n";
        std::cout << std::string(70, '=') << "\n";
        std::cout << "Testing rates:";
        for (int r : config.rates)
            std::cout << " " << r;
        std::cout << " RPS\n";
        std::cout << "Duration: " << config.durationText << "\n";
        std::cout << "Server: " << config.host << ":" << config.port << "\n";
        std::cout << "Workers: " << config.workers << "\n";
        if (config.filterPrefix)
            std::cout << "Filter: " << *config.filterPrefix << "\n";
    }

    BenchCli* cli_ = nullptr;
    std::vector<int> rates_;
    std::string host_;
    int port_ = 0;
    int workers_ = 0;
    std::string duration_;
    std::string filter_;
    std::string routes_;
    std::string serverCmd_;
    std::string seedPath_;
    std::string outputRoot_;
    std::string loadgen_;

    CLI::Option* rateOpt_ = nullptr;
    CLI::Option* hostOpt_ = nullptr;
    CLI::Option* portOpt_ = nullptr;
    CLI::Option* workersOpt_ = nullptr;
};

// Factory function
std::unique_ptr<ICommand> createRunCommand() {
    return std::make_unique<RunCommand>();
}

} // namespace cleanbench::cli
