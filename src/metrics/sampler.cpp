#include <cleanbench/metrics/sampler.h>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <algorithm>
#include <exception>
#include <optional>

namespace cleanbench::metrics {

namespace {

double epoch_seconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

boost::asio::awaitable<ResourceSeries> samplingLoop(SamplingHandle state,
                                                    std::shared_ptr<IProcessProbe> probe,
                                                    std::chrono::milliseconds tick) {
    using clock = std::chrono::steady_clock;
    ResourceSeries series;
    const auto deadline = clock::now() + state->maxDuration;

    std::optional<ProcessTimes> previous;
    clock::time_point previousAt{};
    if (auto baseline = probe->read(state->pid)) {
        previous = baseline.value();
        previousAt = clock::now();
    }

    spdlog::debug("Sampler: started for pid {} ({}ms)", state->pid, state->maxDuration.count());

    while (!state->stopRequested.load(std::memory_order_acquire)) {
        const auto now = clock::now();
        if (now >= deadline) {
            break;
        }
        state->timer->expires_at(std::min(now + tick, deadline));
        boost::system::error_code ec;
        co_await state->timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (state->stopRequested.load(std::memory_order_acquire)) {
            break;
        }

        auto reading = probe->read(state->pid);
        if (!reading) {
            spdlog::debug("Sampler: probe of pid {} failed: {}", state->pid,
                          reading.error().message);
            continue;
        }

        const auto at = clock::now();
        const auto& current = reading.value();
        double cpu = 0.0;
        if (previous) {
            const double wall = std::chrono::duration<double>(at - previousAt).count();
            if (wall > 0.0) {
                cpu = std::max(0.0, (current.cpuSeconds - previous->cpuSeconds) / wall * 100.0);
            }
        }
        previous = current;
        previousAt = at;

        series.push_back(ResourceSample{epoch_seconds(), cpu,
                                        static_cast<double>(current.rssKb) / 1024.0});
    }

    spdlog::debug("Sampler: pid {} sealed with {} samples", state->pid, series.size());
    co_return series;
}

} // namespace

Sampler::Sampler(boost::asio::any_io_executor executor, std::shared_ptr<IProcessProbe> probe,
                 std::chrono::milliseconds tick)
    : executor_(std::move(executor)), probe_(std::move(probe)), tick_(tick) {}

SamplingHandle Sampler::startSampling(int64_t pid, std::chrono::milliseconds maxDuration) {
    auto strand = boost::asio::make_strand(executor_);
    auto state = std::make_shared<SamplingState>();
    state->pid = pid;
    state->maxDuration = maxDuration;
    state->timer = std::make_shared<boost::asio::steady_timer>(strand);
    state->result =
        boost::asio::co_spawn(strand, samplingLoop(state, probe_, tick_), boost::asio::use_future);
    return state;
}

void Sampler::stop(const SamplingHandle& handle) {
    if (!handle || handle->stopRequested.exchange(true)) {
        return;
    }
    // The timer lives on the task's strand; cancel it there
    auto timer = handle->timer;
    boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
}

ResourceSeries Sampler::collect(const SamplingHandle& handle) {
    if (!handle || !handle->result.valid()) {
        return {};
    }
    try {
        return handle->result.get();
    } catch (const std::exception& e) {
        spdlog::warn("Sampler: sampling task for pid {} failed: {}", handle->pid, e.what());
        return {};
    }
}

ResourceSummary Sampler::summarize(const ResourceSeries& series) {
    ResourceSummary summary;
    if (series.empty()) {
        return summary;
    }
    double cpuTotal = 0.0;
    double memTotal = 0.0;
    for (const auto& sample : series) {
        cpuTotal += sample.cpuPercent;
        memTotal += sample.rssMb;
        summary.peakCpu = std::max(summary.peakCpu, sample.cpuPercent);
        summary.peakMemoryMb = std::max(summary.peakMemoryMb, sample.rssMb);
    }
    summary.sampleCount = series.size();
    summary.meanCpu = cpuTotal / static_cast<double>(series.size());
    summary.meanMemoryMb = memTotal / static_cast<double>(series.size());
    return summary;
}

} // namespace cleanbench::metrics
