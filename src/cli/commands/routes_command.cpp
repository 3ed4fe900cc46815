#include <cleanbench/cli/bench_cli.h>
#include <cleanbench/cli/command.h>
#include <cleanbench/discovery/endpoint_discovery.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iostream>

namespace cleanbench::cli {

class RoutesCommand : public ICommand {
public:
    std::string getName() const override { return "routes"; }

    std::string getDescription() const override {
        return "List the endpoints a run would benchmark";
    }

    void registerCommand(CLI::App& app, BenchCli* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--filter", filter_, "Path prefix filter");
        cmd->add_option("--routes", routes_, "Route manifest (routes.json or OpenAPI document)");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto loaded = cli_->loadConfiguration();
        if (!loaded) {
            return loaded.error();
        }
        const auto& config = loaded.value();

        std::optional<std::string> filter = config.filterPrefix;
        if (!filter_.empty())
            filter = filter_;
        auto manifest = routes_.empty() ? config.routesPath : std::filesystem::path(routes_);

        discovery::EndpointDiscovery discovery(
            std::make_shared<discovery::ManifestRouteSource>(manifest), config.server.seedPath);
        auto endpoints = discovery.discover(filter);
        if (!endpoints) {
            return endpoints.error();
        }

        size_t width = 25;
        for (const auto& e : endpoints.value())
            width = std::max(width, e.name.size() + 2);

        for (const auto& e : endpoints.value()) {
            std::cout << fmt::format("{:<{}} {:<5} {}\n", e.name, width, e.method,
                                     discovery::materializeUrl(config.baseUrl(), e.pathTemplate,
                                                               config.server.resourceId));
        }
        std::cout << endpoints.value().size() << " endpoint(s)\n";
        return Result<void>();
    }

private:
    BenchCli* cli_ = nullptr;
    std::string filter_;
    std::string routes_;
};

// Factory function
std::unique_ptr<ICommand> createRoutesCommand() {
    return std::make_unique<RoutesCommand>();
}

} // namespace cleanbench::cli
