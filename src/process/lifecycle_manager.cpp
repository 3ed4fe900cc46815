#include <cleanbench/process/lifecycle_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <thread>
#include <unordered_set>

#include <signal.h>
#include <unistd.h>

namespace cleanbench::process {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> read_argv(const fs::path& procDir) {
    std::vector<std::string> argv;
    std::ifstream in(procDir / "cmdline", std::ios::binary);
    std::string arg;
    while (in && std::getline(in, arg, '\0')) {
        argv.push_back(std::move(arg));
    }
    return argv;
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty())
            joined.push_back(' ');
        joined += arg;
    }
    return joined;
}

// 0 when the status file is missing or has no PPid line
int64_t read_ppid(const fs::path& procDir) {
    std::ifstream in(procDir / "status");
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("PPid:", 0) == 0) {
            try {
                return std::stoll(line.substr(5));
            } catch (const std::exception&) {
                return 0;
            }
        }
    }
    return 0;
}

// pid itself plus every parent up to init
std::unordered_set<int64_t> ancestor_chain(const fs::path& procRoot, int64_t pid) {
    std::unordered_set<int64_t> chain;
    while (pid > 0 && chain.insert(pid).second) {
        pid = read_ppid(procRoot / std::to_string(pid));
    }
    return chain;
}

bool same_program(const std::string& a, const std::string& b) {
    return fs::path(a).filename() == fs::path(b).filename();
}

bool process_exists(pid_t pid) {
    return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace

bool matchesLaunchSignature(const std::vector<std::string>& argv,
                            const std::vector<std::string>& signature) {
    if (signature.empty() || argv.empty())
        return false;

    // The program may run directly, through an interpreter (python3 /usr/bin/uvicorn ...)
    // or as a module (python3 -m uvicorn ...)
    std::vector<size_t> starts{0, 1};
    if (argv.size() > 2 && argv[1] == "-m")
        starts.push_back(2);

    for (size_t start : starts) {
        if (start + signature.size() > argv.size())
            continue;
        if (!same_program(argv[start], signature.front()))
            continue;
        if (std::equal(signature.begin() + 1, signature.end(), argv.begin() + start + 1))
            return true;
    }
    return false;
}

LifecycleOptions LifecycleOptions::fromConfig(const config::RunConfiguration& config) {
    LifecycleOptions options;
    options.healthPath = config.server.healthPath;
    options.signature = config::launchSignature(config);
    return options;
}

ProcessLifecycleManager::ProcessLifecycleManager(std::shared_ptr<net::IHttpClient> http,
                                                 LifecycleOptions options)
    : http_(std::move(http)), options_(std::move(options)) {}

ProcessLifecycleManager::~ProcessLifecycleManager() {
    terminateAll();
}

Result<ServiceInstance> ProcessLifecycleManager::spawn(const config::RunConfiguration& config) {
    if (registry_.contains(config.host, config.port)) {
        return Error{ErrorCode::InvalidState, "A service instance is already live on " +
                                                  config.host + ":" + std::to_string(config.port)};
    }

    auto argv = config::renderServerCommand(config);
    if (argv.empty()) {
        return Error{ErrorCode::InvalidArgument, "Server command is empty"};
    }

    ServiceProcessConfig spec;
    spec.executable = argv.front();
    spec.args.assign(argv.begin() + 1, argv.end());

    try {
        auto process = std::make_unique<ServiceProcess>(std::move(spec));
        ServiceInstance instance{process->pid(), config.host, config.port};
        spdlog::debug("Service started: {} (pid={})", process->command_line(), instance.pid);
        registry_.add(std::move(process), config.host, config.port);
        return instance;
    } catch (const std::exception& e) {
        return Error{ErrorCode::SpawnFailed, e.what()};
    }
}

bool ProcessLifecycleManager::awaitHealthy(const ServiceInstance& instance,
                                           std::chrono::milliseconds timeout) {
    const std::string url = instance.baseUrl() + options_.healthPath;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (!registry_.isAlive(instance.pid)) {
            spdlog::error("Service (pid={}) exited before becoming healthy", instance.pid);
            for (const auto& line : registry_.stderrTail(instance.pid)) {
                spdlog::error("  | {}", line);
            }
            return false;
        }

        auto response = http_->request("GET", url, options_.probeTimeout);
        if (response && response.value().status == 200) {
            return true;
        }

        if (std::chrono::steady_clock::now() + options_.pollInterval > deadline) {
            spdlog::warn("Service (pid={}) not healthy after {}ms", instance.pid,
                         timeout.count());
            return false;
        }
        std::this_thread::sleep_for(options_.pollInterval);
    }
}

void ProcessLifecycleManager::terminate(const ServiceInstance& instance) {
    auto process = registry_.take(instance.pid);
    if (!process) {
        spdlog::debug("terminate: pid {} not registered, nothing to do", instance.pid);
        return;
    }
    if (process->terminate(options_.gracePeriod)) {
        spdlog::warn("Service (pid={}) required SIGKILL", instance.pid);
    }
}

void ProcessLifecycleManager::terminateAll() {
    auto entries = registry_.drain();
    for (auto& entry : entries) {
        if (!entry.process)
            continue;
        spdlog::info("Stopping service (pid={}) on {}:{}", entry.process->pid(), entry.host,
                     entry.port);
        entry.process->terminate(options_.gracePeriod);
    }
}

size_t ProcessLifecycleManager::sweepOrphans() {
    const auto signature = config::splitCommandLine(options_.signature);
    if (signature.empty()) {
        return 0;
    }

    // Our own wrappers (sh -c, timeout, sudo, CI steps) may carry the signature in their argv
    const auto spared = ancestor_chain(options_.procRoot, static_cast<int64_t>(getpid()));
    size_t signalled = 0;

    std::error_code ec;
    fs::directory_iterator it(options_.procRoot, ec);
    if (ec) {
        spdlog::warn("Orphan sweep: cannot list {}: {}", options_.procRoot.string(), ec.message());
        return 0;
    }

    for (const auto& entry : it) {
        try {
            auto name = entry.path().filename().string();
            if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos)
                continue; // not a PID directory

            const int64_t pid = std::stoll(name);
            if (spared.contains(pid) || registry_.contains(pid))
                continue;

            const auto argv = read_argv(entry.path());
            if (!matchesLaunchSignature(argv, signature))
                continue;

            spdlog::info("Found orphaned service (pid={}): {}", pid, join_argv(argv));
            if (killOrphan(pid)) {
                ++signalled;
            }
        } catch (const std::exception& e) {
            spdlog::debug("Orphan sweep: skipping {}: {}", entry.path().string(), e.what());
        }
    }

    if (signalled > 0) {
        spdlog::info("Orphan sweep terminated {} process(es)", signalled);
    }
    return signalled;
}

bool ProcessLifecycleManager::killOrphan(int64_t pid) {
    const auto target = static_cast<pid_t>(pid);
    // Process group leaders take their workers with them
    const bool leader = getpgid(target) == target;
    auto send = [&](int sig) {
        if (leader && kill(-target, sig) == 0)
            return 0;
        return kill(target, sig);
    };

    if (send(SIGTERM) != 0) {
        if (errno != ESRCH) {
            spdlog::warn("Failed to signal orphan (pid={}): {}", pid, strerror(errno));
            return false;
        }
        return true; // already gone
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.gracePeriod;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!process_exists(target))
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (send(SIGKILL) != 0 && errno != ESRCH) {
        spdlog::warn("Failed to kill orphan (pid={}): {}", pid, strerror(errno));
        return false;
    }
    spdlog::info("Sent SIGKILL to orphan (pid={})", pid);
    return true;
}

} // namespace cleanbench::process
