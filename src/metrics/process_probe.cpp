#include <cleanbench/metrics/process_probe.h>

#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

namespace cleanbench::metrics {

ProcfsProbe::ProcfsProbe(std::filesystem::path procRoot) : procRoot_(std::move(procRoot)) {
    long ticks = sysconf(_SC_CLK_TCK);
    ticksPerSecond_ = ticks > 0 ? static_cast<double>(ticks) : 100.0;
}

Result<ProcessTimes> ProcfsProbe::read(int64_t pid) {
    const auto dir = procRoot_ / std::to_string(pid);
    ProcessTimes times;

    std::ifstream pstat(dir / "stat");
    if (!pstat.is_open()) {
        std::error_code ec;
        if (std::filesystem::exists(dir, ec)) {
            return Error{ErrorCode::PermissionDenied, "Cannot read " + (dir / "stat").string()};
        }
        return Error{ErrorCode::NotFound, "No such process: " + std::to_string(pid)};
    }

    std::string content;
    std::getline(pstat, content);
    // stat fields: pid (1) comm (2) state (3) ... utime (14) stime (15)
    // comm may contain spaces in parentheses, so find closing ')'
    auto rparen = content.rfind(')');
    if (rparen == std::string::npos || rparen + 2 >= content.size()) {
        return Error{ErrorCode::InvalidData, "Malformed stat for pid " + std::to_string(pid)};
    }
    std::istringstream iss(content.substr(rparen + 2));
    // Skip fields 3..13
    for (int i = 0; i < 11; ++i) {
        std::string tmp;
        iss >> tmp;
    }
    std::uint64_t utime = 0, stime = 0;
    if (!(iss >> utime >> stime)) {
        return Error{ErrorCode::InvalidData, "Malformed stat for pid " + std::to_string(pid)};
    }
    times.cpuSeconds = static_cast<double>(utime + stime) / ticksPerSecond_;

    // Kernel threads and zombies have no VmRSS line; report zero
    std::ifstream status(dir / "status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream rss(line);
            std::string label;
            rss >> label >> times.rssKb;
            break;
        }
    }
    return times;
}

} // namespace cleanbench::metrics
