#include <algorithm>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cleanbench/cli/bench_cli.h>
#include <cleanbench/process/shutdown_coordinator.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    try {
        // Must precede every thread so the signal watcher is the only receiver
        cleanbench::process::ShutdownCoordinator::blockTerminationSignals();

        // Log to stderr; stdout carries the result tables. BenchCli::run() adjusts the level.
        auto logger = spdlog::stderr_color_mt("cleanbench");
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        // Create io_context for the sampling tasks
        boost::asio::io_context io_context;
        auto work_guard = boost::asio::make_work_guard(io_context);

        unsigned int thread_count = std::thread::hardware_concurrency();
        if (thread_count == 0)
            thread_count = 2;
        thread_count = std::min(thread_count, 4u);

        std::vector<std::thread> threads;
        for (unsigned int i = 0; i < thread_count; ++i) {
            threads.emplace_back([&io_context]() { io_context.run(); });
        }

        int result = 0;
        {
            cleanbench::cli::BenchCli cli(io_context.get_executor());
            result = cli.run(argc, argv);
        }

        // Cleanup
        work_guard.reset();
        io_context.stop();
        for (auto& t : threads) {
            if (t.joinable())
                t.join();
        }

        return result;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
