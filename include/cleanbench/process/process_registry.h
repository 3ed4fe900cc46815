#pragma once

#include <cleanbench/process/service_process.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cleanbench::process {

/**
 * @brief Live service processes owned by this run
 *
 * Entries are added by spawn and removed by terminate or drain. Removal is idempotent, and
 * drain() hands ownership out under the lock so concurrent callers never see the same entry.
 */
class ProcessRegistry {
public:
    struct Entry {
        std::unique_ptr<ServiceProcess> process;
        std::string host;
        int port{0};
    };

    void add(std::unique_ptr<ServiceProcess> process, std::string host, int port);

    // nullptr when the pid is not (or no longer) registered
    std::unique_ptr<ServiceProcess> take(int64_t pid);

    std::vector<Entry> drain();

    bool contains(int64_t pid) const;
    bool contains(const std::string& host, int port) const;
    std::vector<int64_t> pids() const;
    size_t size() const;
    bool empty() const { return size() == 0; }

    // Process liveness without transferring ownership; false for unknown pids
    bool isAlive(int64_t pid) const;

    std::vector<std::string> stderrTail(int64_t pid) const;

private:
    mutable std::mutex mutex_;
    std::map<int64_t, Entry> entries_;
};

} // namespace cleanbench::process
