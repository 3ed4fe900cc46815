#include <cleanbench/cli/bench_cli.h>
#include <cleanbench/cli/command.h>
#include <cleanbench/net/http_client.h>
#include <cleanbench/process/lifecycle_manager.h>

#include <iostream>

namespace cleanbench::cli {

class SweepCommand : public ICommand {
public:
    std::string getName() const override { return "sweep"; }

    std::string getDescription() const override {
        return "Terminate service processes left behind by an earlier run";
    }

    void registerCommand(CLI::App& app, BenchCli* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--signature", signature_,
                        "Command line substring to match (default: the rendered server command)");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto loaded = cli_->loadConfiguration();
        if (!loaded) {
            return loaded.error();
        }
        auto options = process::LifecycleOptions::fromConfig(loaded.value());
        if (!signature_.empty())
            options.signature = signature_;

        std::cout << "Sweeping processes matching: " << options.signature << "\n";
        process::ProcessLifecycleManager manager(net::makeCurlHttpClient(), options);
        auto count = manager.sweepOrphans();
        std::cout << "Terminated " << count << " orphaned process(es)\n";
        return Result<void>();
    }

private:
    BenchCli* cli_ = nullptr;
    std::string signature_;
};

// Factory function
std::unique_ptr<ICommand> createSweepCommand() {
    return std::make_unique<SweepCommand>();
}

} // namespace cleanbench::cli
