#pragma once

#include <cleanbench/core/types.h>

#include <cstdint>
#include <filesystem>

namespace cleanbench::metrics {

/**
 * @brief Cumulative resource counters for one process at one instant
 */
struct ProcessTimes {
    double cpuSeconds{0.0}; ///< utime + stime
    std::uint64_t rssKb{0};
};

class IProcessProbe {
public:
    virtual ~IProcessProbe() = default;

    // NotFound when the process is gone; PermissionDenied when it cannot be inspected
    virtual Result<ProcessTimes> read(int64_t pid) = 0;
};

/**
 * Linux probe reading /proc/<pid>/stat and /proc/<pid>/status.
 */
class ProcfsProbe final : public IProcessProbe {
public:
    explicit ProcfsProbe(std::filesystem::path procRoot = "/proc");

    Result<ProcessTimes> read(int64_t pid) override;

private:
    std::filesystem::path procRoot_;
    double ticksPerSecond_;
};

} // namespace cleanbench::metrics
