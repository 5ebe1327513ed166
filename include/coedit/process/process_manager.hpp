#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace coedit::process {

// Command line and lifecycle settings shared by every session's process.
struct ProcessSpec {
    std::string executable;
    std::vector<std::string> args;
    std::filesystem::path working_dir;
    std::chrono::milliseconds kill_grace{5000};
};

/**
 * A child process with all three standard streams captured by pipes.
 *
 * The object owns the parent ends of the pipes and closes them on
 * destruction. Callers that need an independent handle for asynchronous I/O
 * take one with duplicate_*_fd().
 * Thread-safe: liveness checks and termination are serialized internally.
 */
class AnalysisProcess {
public:
    // Fork/exec `spec`. Throws SpawnError with the OS cause on failure.
    static std::shared_ptr<AnalysisProcess> launch(const ProcessSpec& spec);

    ~AnalysisProcess();

    AnalysisProcess(const AnalysisProcess&) = delete;
    AnalysisProcess& operator=(const AnalysisProcess&) = delete;

    pid_t pid() const { return pid_; }

    // Non-blocking; reaps the child when it has exited.
    bool alive();

    // Raw wait status once the child has been reaped.
    std::optional<int> exit_status();

    // SIGTERM, wait up to `grace`, then SIGKILL. Returns once reaped.
    // No-op for a process that already exited.
    void terminate(std::chrono::milliseconds grace);

    // Close-on-exec duplicates; the caller owns the returned descriptor.
    int duplicate_stdin_fd() const;
    int duplicate_stdout_fd() const;
    int duplicate_stderr_fd() const;

private:
    AnalysisProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    bool reap_locked(bool block);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    std::mutex mutex_;
    std::optional<int> status_;
};

/**
 * One analysis process per session id.
 *
 * All operations lock the session map, so two callers can never race to
 * spawn duplicate processes for one id. kill() releases the lock before the
 * graceful-termination wait.
 */
class ProcessManager {
public:
    explicit ProcessManager(ProcessSpec spec);
    ~ProcessManager();

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;

    // Existing live process for the id, or a freshly launched one.
    // Throws SpawnError; never retries.
    std::shared_ptr<AnalysisProcess> spawn(const std::string& session_id);

    // Idempotent. The entry is gone by the time this returns.
    void kill(const std::string& session_id);

    // Used at shutdown.
    void kill_all();

    bool contains(const std::string& session_id) const;
    std::size_t size() const;
    const ProcessSpec& spec() const { return spec_; }

private:
    ProcessSpec spec_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<AnalysisProcess>> processes_;
};

} // namespace coedit::process
