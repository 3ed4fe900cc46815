#include <cleanbench/process/process_registry.h>

namespace cleanbench::process {

void ProcessRegistry::add(std::unique_ptr<ServiceProcess> process, std::string host, int port) {
    if (!process)
        return;
    const int64_t pid = process->pid();
    std::lock_guard lock{mutex_};
    entries_[pid] = Entry{std::move(process), std::move(host), port};
}

std::unique_ptr<ServiceProcess> ProcessRegistry::take(int64_t pid) {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(pid);
    if (it == entries_.end()) {
        return nullptr;
    }
    auto process = std::move(it->second.process);
    entries_.erase(it);
    return process;
}

std::vector<ProcessRegistry::Entry> ProcessRegistry::drain() {
    std::lock_guard lock{mutex_};
    std::vector<Entry> out;
    out.reserve(entries_.size());
    for (auto& [pid, entry] : entries_) {
        out.push_back(std::move(entry));
    }
    entries_.clear();
    return out;
}

bool ProcessRegistry::contains(int64_t pid) const {
    std::lock_guard lock{mutex_};
    return entries_.contains(pid);
}

bool ProcessRegistry::contains(const std::string& host, int port) const {
    std::lock_guard lock{mutex_};
    for (const auto& [pid, entry] : entries_) {
        if (entry.host == host && entry.port == port)
            return true;
    }
    return false;
}

std::vector<int64_t> ProcessRegistry::pids() const {
    std::lock_guard lock{mutex_};
    std::vector<int64_t> out;
    out.reserve(entries_.size());
    for (const auto& [pid, entry] : entries_) {
        out.push_back(pid);
    }
    return out;
}

size_t ProcessRegistry::size() const {
    std::lock_guard lock{mutex_};
    return entries_.size();
}

bool ProcessRegistry::isAlive(int64_t pid) const {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(pid);
    return it != entries_.end() && it->second.process && it->second.process->is_alive();
}

std::vector<std::string> ProcessRegistry::stderrTail(int64_t pid) const {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(pid);
    if (it == entries_.end() || !it->second.process)
        return {};
    return it->second.process->stderr_tail();
}

} // namespace cleanbench::process
