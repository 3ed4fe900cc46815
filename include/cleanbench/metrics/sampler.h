#pragma once

#include <cleanbench/metrics/process_probe.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <vector>

namespace cleanbench::metrics {

struct ResourceSample {
    double timestamp{0.0}; ///< Seconds since the Unix epoch
    double cpuPercent{0.0};
    double rssMb{0.0};
};

using ResourceSeries = std::vector<ResourceSample>;

struct ResourceSummary {
    double meanCpu{0.0};
    double peakCpu{0.0};
    double meanMemoryMb{0.0};
    double peakMemoryMb{0.0};
    std::size_t sampleCount{0};
};

/**
 * @brief State of one in-flight sampling task
 *
 * The series is sealed once the future is ready; a handle cannot be restarted.
 */
struct SamplingState {
    int64_t pid{-1};
    std::chrono::milliseconds maxDuration{0};
    std::atomic<bool> stopRequested{false};
    std::shared_ptr<boost::asio::steady_timer> timer;
    std::future<ResourceSeries> result;
};

using SamplingHandle = std::shared_ptr<SamplingState>;

/**
 * @brief Periodic CPU/RSS sampler for a single process
 *
 * Each task is a coroutine on its own strand of the given executor. CPU percent is the
 * process's CPU time over wall time between consecutive samples, so a process saturating
 * two cores reads 200%.
 */
class Sampler {
public:
    Sampler(boost::asio::any_io_executor executor, std::shared_ptr<IProcessProbe> probe,
            std::chrono::milliseconds tick = std::chrono::seconds{1});

    SamplingHandle startSampling(int64_t pid, std::chrono::milliseconds maxDuration);

    // Ask the task to finish at its next wakeup; safe to call more than once
    void stop(const SamplingHandle& handle);

    // Blocks until the task finishes and returns the sealed series
    ResourceSeries collect(const SamplingHandle& handle);

    static ResourceSummary summarize(const ResourceSeries& series);

private:
    boost::asio::any_io_executor executor_;
    std::shared_ptr<IProcessProbe> probe_;
    std::chrono::milliseconds tick_;
};

} // namespace cleanbench::metrics
