#include <cleanbench/bench/result_store.h>
#include <cleanbench/cli/bench_cli.h>
#include <cleanbench/cli/command.h>

#include <spdlog/spdlog.h>

#include <iostream>

namespace cleanbench::cli {

class SummaryCommand : public ICommand {
public:
    std::string getName() const override { return "summary"; }

    std::string getDescription() const override {
        return "Print result tables and analysis for a finished run";
    }

    void registerCommand(CLI::App& app, BenchCli* cli) override {
        cli_ = cli;
        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("--results", resultsPath_,
                        "clean_results.json to summarize (default: the most recent run)");
        cmd->add_option("--output-root", outputRoot_, "Directory searched for runs");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto loaded = cli_->loadConfiguration();
        if (!loaded) {
            return loaded.error();
        }

        std::vector<std::filesystem::path> roots;
        if (!outputRoot_.empty()) {
            roots.emplace_back(outputRoot_);
        } else {
            roots.push_back(loaded.value().outputRoot);
        }
        bench::ResultStore store(roots);

        std::filesystem::path source = resultsPath_;
        if (source.empty()) {
            auto latest = store.findLatest();
            if (!latest) {
                return latest.error();
            }
            source = latest.value();
        }

        auto result = store.load(source);
        if (!result) {
            return result.error();
        }

        const auto& run = result.value();
        std::cout << "Results: " << source.string() << "\n";
        std::cout << "Run: " << run.metadata.timestamp << "  " << run.metadata.host << ":"
                  << run.metadata.port << "  workers=" << run.metadata.workers
                  << "  duration=" << run.metadata.duration << "  status=" << run.metadata.status
                  << "\n";
        bench::renderTables(run, std::cout);
        bench::renderAnalysis(bench::summarize(run), std::cout);
        return Result<void>();
    }

private:
    BenchCli* cli_ = nullptr;
    std::string resultsPath_;
    std::string outputRoot_;
};

// Factory function
std::unique_ptr<ICommand> createSummaryCommand() {
    return std::make_unique<SummaryCommand>();
}

} // namespace cleanbench::cli
