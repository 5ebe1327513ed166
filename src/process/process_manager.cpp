#include "coedit/process/process_manager.hpp"
#include "coedit/error.hpp"
#include "coedit/logging.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace coedit::process {

namespace {

// Owns one descriptor until released.
class UniqueFd {
public:
    UniqueFd() = default;
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

void open_pipe(Pipe& pipe, const char* name) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw SpawnError(std::string("pipe() failed for ") + name + ": " + std::strerror(errno));
    }
    pipe.read_end.reset(fds[0]);
    pipe.write_end.reset(fds[1]);
}

int duplicate_cloexec(int fd) {
    int copy = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    if (copy < 0) {
        throw SpawnError(std::string("fcntl(F_DUPFD_CLOEXEC) failed: ") + std::strerror(errno));
    }
    return copy;
}

// Runs in the forked child; only async-signal-safe calls from here on.
[[noreturn]] void exec_child(int stdin_fd, int stdout_fd, int stderr_fd, int report_fd,
                             const char* working_dir, char* const* argv) {
    auto fail = [report_fd]() {
        int err = errno;
        ssize_t ignored = ::write(report_fd, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    };

    if (::dup2(stdin_fd, STDIN_FILENO) < 0 ||
        ::dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        ::dup2(stderr_fd, STDERR_FILENO) < 0) {
        fail();
    }
    ::signal(SIGPIPE, SIG_DFL);
    if (working_dir && ::chdir(working_dir) != 0) {
        fail();
    }
    ::execvp(argv[0], argv);
    fail();
    ::_exit(127);
}

} // namespace

// =============================================================================
// AnalysisProcess
// =============================================================================

std::shared_ptr<AnalysisProcess> AnalysisProcess::launch(const ProcessSpec& spec) {
    if (spec.executable.empty()) {
        throw SpawnError("No executable configured");
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> arguments;
    arguments.reserve(spec.args.size() + 1);
    arguments.push_back(spec.executable);
    arguments.insert(arguments.end(), spec.args.begin(), spec.args.end());

    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (auto& argument : arguments) {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);

    const std::string working_dir = spec.working_dir.string();

    Pipe in_pipe, out_pipe, err_pipe, report_pipe;
    open_pipe(in_pipe, "stdin");
    open_pipe(out_pipe, "stdout");
    open_pipe(err_pipe, "stderr");
    open_pipe(report_pipe, "exec status");

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw SpawnError(std::string("fork() failed: ") + std::strerror(errno), spec.executable);
    }
    if (pid == 0) {
        exec_child(in_pipe.read_end.get(), out_pipe.write_end.get(), err_pipe.write_end.get(),
                   report_pipe.write_end.get(), working_dir.empty() ? nullptr : working_dir.c_str(),
                   argv.data());
    }

    in_pipe.read_end.reset();
    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    report_pipe.write_end.reset();

    // The report pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(report_pipe.read_end.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw SpawnError("Failed to start '" + spec.executable + "': " + std::strerror(child_errno),
                         "working directory: " + (working_dir.empty() ? std::string(".") : working_dir),
                         "Check that the executable is on PATH and the directory exists");
    }

    return std::shared_ptr<AnalysisProcess>(new AnalysisProcess(
        pid, in_pipe.write_end.release(), out_pipe.read_end.release(), err_pipe.read_end.release()));
}

AnalysisProcess::AnalysisProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

AnalysisProcess::~AnalysisProcess() {
    ::close(stdin_fd_);
    ::close(stdout_fd_);
    ::close(stderr_fd_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!status_ && !reap_locked(false)) {
        // Never leave an orphan behind.
        ::kill(pid_, SIGKILL);
        reap_locked(true);
    }
}

bool AnalysisProcess::reap_locked(bool block) {
    if (status_) {
        return true;
    }
    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        status_ = status;
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to wait for.
        status_ = 0;
        return true;
    }
    return false;
}

bool AnalysisProcess::alive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !reap_locked(false);
}

std::optional<int> AnalysisProcess::exit_status() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked(false);
    return status_;
}

void AnalysisProcess::terminate(std::chrono::milliseconds grace) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reap_locked(false)) {
            return;
        }
        ::kill(pid_, SIGTERM);
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reap_locked(false)) {
                return;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!reap_locked(false)) {
        LOG_WARNING("Process " + std::to_string(pid_) + " ignored SIGTERM for " +
                    std::to_string(grace.count()) + "ms, sending SIGKILL");
        ::kill(pid_, SIGKILL);
        reap_locked(true);
    }
}

int AnalysisProcess::duplicate_stdin_fd() const {
    return duplicate_cloexec(stdin_fd_);
}

int AnalysisProcess::duplicate_stdout_fd() const {
    return duplicate_cloexec(stdout_fd_);
}

int AnalysisProcess::duplicate_stderr_fd() const {
    return duplicate_cloexec(stderr_fd_);
}

// =============================================================================
// ProcessManager
// =============================================================================

ProcessManager::ProcessManager(ProcessSpec spec) : spec_(std::move(spec)) {}

ProcessManager::~ProcessManager() {
    kill_all();
}

std::shared_ptr<AnalysisProcess> ProcessManager::spawn(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = processes_.find(session_id);
    if (it != processes_.end()) {
        if (it->second->alive()) {
            return it->second;
        }
        LOG_INFO("Process for session " + session_id + " has exited, replacing it");
        processes_.erase(it);
    }

    auto process = AnalysisProcess::launch(spec_);
    processes_.emplace(session_id, process);
    LOG_INFO("Spawned " + spec_.executable + " for session " + session_id +
             " (pid=" + std::to_string(process->pid()) + ")");
    return process;
}

void ProcessManager::kill(const std::string& session_id) {
    std::shared_ptr<AnalysisProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(session_id);
        if (it == processes_.end()) {
            return;
        }
        process = std::move(it->second);
        processes_.erase(it);
    }

    if (process->alive()) {
        process->terminate(spec_.kill_grace);
        LOG_INFO("Killed " + spec_.executable + " for session " + session_id);
    }
}

void ProcessManager::kill_all() {
    std::vector<std::string> session_ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ids.reserve(processes_.size());
        for (const auto& [session_id, process] : processes_) {
            session_ids.push_back(session_id);
        }
    }
    for (const auto& session_id : session_ids) {
        kill(session_id);
    }
}

bool ProcessManager::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.count(session_id) > 0;
}

std::size_t ProcessManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

} // namespace coedit::process
