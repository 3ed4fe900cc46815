#include <cleanbench/process/service_process.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace cleanbench::process {

const char* toString(ProcessState state) noexcept {
    switch (state) {
        case ProcessState::Unstarted:
            return "unstarted";
        case ProcessState::Starting:
            return "starting";
        case ProcessState::Running:
            return "running";
        case ProcessState::ShuttingDown:
            return "shutting-down";
        case ProcessState::Terminated:
            return "terminated";
        case ProcessState::Failed:
            return "failed";
    }
    return "unknown";
}

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Environment block for execvpe: the parent environment with overrides applied.
// Built before fork() so the child does not allocate.
std::vector<std::string>
build_environment(const std::unordered_map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry{*e};
        auto eq = entry.find('=');
        std::string key{entry.substr(0, eq)};
        if (!overrides.contains(key)) {
            out.emplace_back(entry);
        }
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

} // namespace

/**
 * @brief POSIX process implementation (Pimpl)
 */
class ServiceProcess::Impl {
public:
    explicit Impl(ServiceProcessConfig config);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    [[nodiscard]] ProcessState state() const noexcept;
    [[nodiscard]] bool is_alive() const noexcept;
    bool terminate(std::chrono::milliseconds timeout);
    [[nodiscard]] int64_t pid() const noexcept;
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<int> exit_code() const noexcept;
    [[nodiscard]] std::vector<std::string> stderr_tail() const;
    [[nodiscard]] std::string command_line() const;

private:
    void spawn_process();
    void start_io_threads();
    void stop_io_threads();
    void pump_loop(std::stop_token stop, int fd, bool is_stderr);
    void emit_line(std::string_view line, bool is_stderr);
    bool try_reap() const noexcept;
    void send_signal(int sig) const noexcept;

    ServiceProcessConfig config_;
    mutable std::atomic<ProcessState> state_{ProcessState::Unstarted};

    mutable std::mutex reap_mutex_;
    mutable std::optional<int> exit_code_;
    mutable bool reaped_{false};

    mutable std::mutex stderr_mutex_;
    std::deque<std::string> stderr_tail_;

    std::jthread stdout_thread_;
    std::jthread stderr_thread_;

    pid_t process_id_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};
};

ServiceProcess::Impl::Impl(ServiceProcessConfig config) : config_{std::move(config)} {
    spdlog::debug("ServiceProcess: Spawning process: {}", command_line());

    // A child dying mid-write must not take the orchestrator down with it
    signal(SIGPIPE, SIG_IGN);

    state_.store(ProcessState::Starting, std::memory_order_release);

    try {
        spawn_process();
        start_io_threads();
        state_.store(ProcessState::Running, std::memory_order_release);
    } catch (...) {
        state_.store(ProcessState::Failed, std::memory_order_release);
        close_fd(stdout_fd_);
        close_fd(stderr_fd_);
        throw;
    }
}

ServiceProcess::Impl::~Impl() {
    if (is_alive()) {
        spdlog::debug("ServiceProcess::~Impl(): pid {} still alive, terminating", process_id_);
        terminate(std::chrono::seconds{5});
    }
    stop_io_threads();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ServiceProcess::Impl::spawn_process() {
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    int stdout_file_fd = -1;

    auto cleanup = [&]() {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
        close_fd(stdout_file_fd);
    };

    if (pipe2(exec_pipe, O_CLOEXEC) < 0 || pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        cleanup();
        throw std::runtime_error("Failed to create pipes: " + std::string(strerror(errno)));
    }
    if (config_.stdout_file) {
        stdout_file_fd = ::open(config_.stdout_file->c_str(),
                                O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (stdout_file_fd < 0) {
            std::string msg = "Failed to open " + config_.stdout_file->string() + ": " +
                              std::string(strerror(errno));
            cleanup();
            throw std::runtime_error(msg);
        }
    } else if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        cleanup();
        throw std::runtime_error("Failed to create pipes: " + std::string(strerror(errno)));
    }

    // Everything the child needs is materialized before fork()
    std::vector<std::string> arg_storage;
    arg_storage.push_back(config_.executable.string());
    arg_storage.insert(arg_storage.end(), config_.args.begin(), config_.args.end());
    std::vector<char*> argv;
    for (auto& a : arg_storage)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(config_.env);
    std::vector<char*> envp;
    for (auto& e : env_storage)
        envp.push_back(e.data());
    envp.push_back(nullptr);

    const int child_stdout = stdout_file_fd >= 0 ? stdout_file_fd : stdout_pipe[1];
    const bool own_group = config_.own_process_group;
    const char* workdir = config_.workdir ? config_.workdir->c_str() : nullptr;

    pid_t pid = fork();
    if (pid < 0) {
        std::string msg = "fork() failed: " + std::string(strerror(errno));
        cleanup();
        throw std::runtime_error(msg);
    }

    if (pid == 0) {
        // Child: the orchestrator blocks SIGINT/SIGTERM for its watcher thread; undo that
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGPIPE, SIG_DFL);

        if (own_group) {
            setpgid(0, 0);
        }

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        dup2(child_stdout, STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        if (workdir && chdir(workdir) < 0) {
            int err = errno;
            (void)!write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }

    // Parent process
    process_id_ = pid;
    if (own_group) {
        // Also set from the parent so signalling the group cannot race the child's setpgid
        setpgid(pid, pid);
    }

    close_fd(exec_pipe[1]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(stdout_file_fd);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        reaped_ = true;
        exit_code_ = 127;
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        throw std::runtime_error("exec '" + config_.executable.string() +
                                 "' failed: " + std::string(strerror(child_errno)));
    }

    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    if (stdout_fd_ >= 0)
        fcntl(stdout_fd_, F_SETFL, O_NONBLOCK);
    fcntl(stderr_fd_, F_SETFL, O_NONBLOCK);

    spdlog::info("ServiceProcess: Spawned {} (pid={})", config_.executable.string(), process_id_);
}

void ServiceProcess::Impl::start_io_threads() {
    if (stdout_fd_ >= 0) {
        stdout_thread_ = std::jthread{
            [this](std::stop_token stop) { pump_loop(std::move(stop), stdout_fd_, false); }};
    }
    stderr_thread_ = std::jthread{
        [this](std::stop_token stop) { pump_loop(std::move(stop), stderr_fd_, true); }};
}

void ServiceProcess::Impl::stop_io_threads() {
    stdout_thread_.request_stop();
    stderr_thread_.request_stop();
    if (stdout_thread_.joinable()) {
        stdout_thread_.join();
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
}

void ServiceProcess::Impl::pump_loop(std::stop_token stop, int fd, bool is_stderr) {
    std::array<char, 4096> buffer;
    std::string partial;

    while (!stop.stop_requested()) {
        ssize_t bytes_read = ::read(fd, buffer.data(), buffer.size());
        if (bytes_read > 0) {
            partial.append(buffer.data(), static_cast<size_t>(bytes_read));
            size_t newline;
            while ((newline = partial.find('\n')) != std::string::npos) {
                emit_line(std::string_view{partial}.substr(0, newline), is_stderr);
                partial.erase(0, newline + 1);
            }
            continue;
        }
        if (bytes_read == 0) {
            break; // every writer (child and its descendants) closed the pipe
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }

    if (!partial.empty()) {
        emit_line(partial, is_stderr);
    }
}

void ServiceProcess::Impl::emit_line(std::string_view line, bool is_stderr) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (!is_stderr) {
        spdlog::trace("[pid {} stdout] {}", process_id_, line);
        return;
    }

    spdlog::debug("[pid {} stderr] {}", process_id_, line);
    if (config_.stderr_tail_lines == 0) {
        return;
    }
    std::lock_guard lock{stderr_mutex_};
    stderr_tail_.emplace_back(line);
    while (stderr_tail_.size() > config_.stderr_tail_lines) {
        stderr_tail_.pop_front();
    }
}

bool ServiceProcess::Impl::try_reap() const noexcept {
    std::lock_guard lock{reap_mutex_};
    if (reaped_ || process_id_ <= 0) {
        return true;
    }

    int status = 0;
    pid_t result = waitpid(process_id_, &status, WNOHANG);
    if (result == process_id_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
        reaped_ = true;
    } else if (result < 0 && errno == ECHILD) {
        // Already reaped elsewhere; nothing left to wait for
        reaped_ = true;
    }

    if (reaped_) {
        state_.store(ProcessState::Terminated, std::memory_order_release);
    }
    return reaped_;
}

void ServiceProcess::Impl::send_signal(int sig) const noexcept {
    if (process_id_ <= 0) {
        return;
    }
    if (config_.own_process_group && kill(-process_id_, sig) == 0) {
        return;
    }
    kill(process_id_, sig);
}

bool ServiceProcess::Impl::terminate(std::chrono::milliseconds timeout) {
    if (!is_alive()) {
        spdlog::debug("ServiceProcess::terminate(): pid {} not alive, nothing to do", process_id_);
        return false;
    }

    spdlog::info("ServiceProcess: Terminating {} (pid={})", config_.executable.string(),
                 process_id_);
    state_.store(ProcessState::ShuttingDown, std::memory_order_release);

    send_signal(SIGTERM);
    if (wait_for_exit(timeout)) {
        // Leader is gone; stragglers left in its group get no second chance
        if (config_.own_process_group && kill(-process_id_, 0) == 0) {
            spdlog::debug("ServiceProcess: Killing remaining members of group {}", process_id_);
            kill(-process_id_, SIGKILL);
        }
        state_.store(ProcessState::Terminated, std::memory_order_release);
        return false;
    }

    spdlog::warn("ServiceProcess: pid {} ignored SIGTERM for {}ms, sending SIGKILL", process_id_,
                 timeout.count());
    send_signal(SIGKILL);
    if (!wait_for_exit(std::chrono::seconds{1})) {
        spdlog::error("ServiceProcess: pid {} still present after SIGKILL", process_id_);
    }
    state_.store(ProcessState::Terminated, std::memory_order_release);
    return true;
}

bool ServiceProcess::Impl::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (try_reap()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

ProcessState ServiceProcess::Impl::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

bool ServiceProcess::Impl::is_alive() const noexcept {
    auto current = state();
    if (current != ProcessState::Starting && current != ProcessState::Running &&
        current != ProcessState::ShuttingDown) {
        return false;
    }
    return !try_reap();
}

int64_t ServiceProcess::Impl::pid() const noexcept {
    return static_cast<int64_t>(process_id_);
}

std::optional<int> ServiceProcess::Impl::exit_code() const noexcept {
    std::lock_guard lock{reap_mutex_};
    return exit_code_;
}

std::vector<std::string> ServiceProcess::Impl::stderr_tail() const {
    std::lock_guard lock{stderr_mutex_};
    return {stderr_tail_.begin(), stderr_tail_.end()};
}

std::string ServiceProcess::Impl::command_line() const {
    std::string out = config_.executable.string();
    for (const auto& arg : config_.args) {
        out.push_back(' ');
        out += arg;
    }
    return out;
}

// ============================================================================
// ServiceProcess Public Interface (forwards to Impl)
// ============================================================================

ServiceProcess::ServiceProcess(ServiceProcessConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))} {}

ServiceProcess::~ServiceProcess() = default;

ServiceProcess::ServiceProcess(ServiceProcess&&) noexcept = default;
ServiceProcess& ServiceProcess::operator=(ServiceProcess&&) noexcept = default;

ProcessState ServiceProcess::state() const noexcept {
    return impl_->state();
}

bool ServiceProcess::is_alive() const noexcept {
    return impl_->is_alive();
}

bool ServiceProcess::terminate(std::chrono::milliseconds timeout) {
    return impl_->terminate(timeout);
}

int64_t ServiceProcess::pid() const noexcept {
    return impl_->pid();
}

bool ServiceProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    return impl_->wait_for_exit(timeout);
}

std::optional<int> ServiceProcess::exit_code() const noexcept {
    return impl_->exit_code();
}

std::vector<std::string> ServiceProcess::stderr_tail() const {
    return impl_->stderr_tail();
}

std::string ServiceProcess::command_line() const {
    return impl_->command_line();
}

} // namespace cleanbench::process
