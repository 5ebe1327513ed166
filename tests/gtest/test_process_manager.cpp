// =============================================================================
// Analysis Process Manager Tests
// =============================================================================

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <csignal>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

#include "coedit/error.hpp"
#include "coedit/process/process_manager.hpp"

using namespace coedit;
using namespace coedit::process;
using namespace std::chrono_literals;

namespace {

ProcessSpec cat_spec() {
    ProcessSpec spec;
    spec.executable = "/bin/cat";
    spec.working_dir = "/tmp";
    spec.kill_grace = 2000ms;
    return spec;
}

ProcessSpec shell_spec(const std::string& script, std::chrono::milliseconds grace = 2000ms) {
    ProcessSpec spec;
    spec.executable = "/bin/sh";
    spec.args = {"-c", script};
    spec.working_dir = "/tmp";
    spec.kill_grace = grace;
    return spec;
}

// Blocking read of one line from a duplicated descriptor; closes it afterwards.
std::string read_line(int fd) {
    std::string line;
    char c;
    while (::read(fd, &c, 1) == 1) {
        line.push_back(c);
        if (c == '\n') break;
    }
    ::close(fd);
    return line;
}

bool wait_until_exited(AnalysisProcess& process, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!process.alive()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} // namespace

class ProcessManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::signal(SIGPIPE, SIG_IGN);
    }
};

TEST_F(ProcessManagerTest, SpawnIsIdempotentForLiveSession) {
    ProcessManager manager(cat_spec());

    auto first = manager.spawn("session-a");
    auto second = manager.spawn("session-a");

    EXPECT_EQ(first, second);
    EXPECT_EQ(first->pid(), second->pid());
    EXPECT_TRUE(first->alive());
    EXPECT_EQ(manager.size(), 1u);
}

TEST_F(ProcessManagerTest, DistinctSessionsGetDistinctProcesses) {
    ProcessManager manager(cat_spec());

    auto a = manager.spawn("a");
    auto b = manager.spawn("b");

    EXPECT_NE(a->pid(), b->pid());
    EXPECT_EQ(manager.size(), 2u);
}

TEST_F(ProcessManagerTest, ExitedProcessIsReplaced) {
    ProcessManager manager(shell_spec("exit 0"));

    auto first = manager.spawn("session-a");
    ASSERT_TRUE(wait_until_exited(*first, 5s));

    auto second = manager.spawn("session-a");
    EXPECT_NE(first, second);
    EXPECT_NE(first->pid(), second->pid());
    EXPECT_EQ(manager.size(), 1u);
}

TEST_F(ProcessManagerTest, ConcurrentSpawnCreatesOneProcess) {
    ProcessManager manager(cat_spec());

    std::vector<std::thread> threads;
    std::vector<pid_t> pids(8, 0);
    for (std::size_t i = 0; i < pids.size(); ++i) {
        threads.emplace_back([&manager, &pids, i]() { pids[i] = manager.spawn("shared")->pid(); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(std::set<pid_t>(pids.begin(), pids.end()).size(), 1u);
    EXPECT_EQ(manager.size(), 1u);
}

TEST_F(ProcessManagerTest, StandardStreamsArePiped) {
    ProcessManager manager(cat_spec());
    auto process = manager.spawn("echo");

    const int in = process->duplicate_stdin_fd();
    const std::string text = "hello analysis\n";
    ASSERT_EQ(::write(in, text.data(), text.size()), static_cast<ssize_t>(text.size()));
    ::close(in);

    EXPECT_EQ(read_line(process->duplicate_stdout_fd()), text);
}

TEST_F(ProcessManagerTest, WorkingDirectoryIsApplied) {
    ProcessManager manager(shell_spec("pwd; exec cat"));
    auto process = manager.spawn("cwd");
    EXPECT_EQ(read_line(process->duplicate_stdout_fd()), "/tmp\n");
}

TEST_F(ProcessManagerTest, MissingExecutableIsSpawnError) {
    ProcessSpec spec = cat_spec();
    spec.executable = "/nonexistent/coedit-analysis-server";
    ProcessManager manager(spec);

    try {
        manager.spawn("broken");
        FAIL() << "Expected SpawnError";
    } catch (const SpawnError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SPAWN_FAILED);
        EXPECT_THAT(e.message(), ::testing::HasSubstr("No such file or directory"));
    }
    EXPECT_FALSE(manager.contains("broken"));
}

TEST_F(ProcessManagerTest, MissingWorkingDirectoryIsSpawnError) {
    ProcessSpec spec = cat_spec();
    spec.working_dir = "/nonexistent/coedit-project";
    ProcessManager manager(spec);

    EXPECT_THROW(manager.spawn("broken"), SpawnError);
    EXPECT_EQ(manager.size(), 0u);
}

TEST_F(ProcessManagerTest, KillTerminatesAndRemoves) {
    ProcessManager manager(cat_spec());
    auto process = manager.spawn("session-a");

    const auto start = std::chrono::steady_clock::now();
    manager.kill("session-a");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(manager.contains("session-a"));
    EXPECT_FALSE(process->alive());
    EXPECT_LT(elapsed, manager.spec().kill_grace + 1s);

    auto status = process->exit_status();
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(WIFSIGNALED(*status));
    EXPECT_EQ(WTERMSIG(*status), SIGTERM);
}

TEST_F(ProcessManagerTest, KillForcesProcessIgnoringTerm) {
    ProcessManager manager(shell_spec("trap '' TERM; echo ready; while :; do sleep 0.05; done", 200ms));
    auto process = manager.spawn("stubborn");
    ASSERT_EQ(read_line(process->duplicate_stdout_fd()), "ready\n");

    const auto start = std::chrono::steady_clock::now();
    manager.kill("stubborn");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 3s);
    auto status = process->exit_status();
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(WIFSIGNALED(*status));
    EXPECT_EQ(WTERMSIG(*status), SIGKILL);
}

TEST_F(ProcessManagerTest, KillIsIdempotent) {
    ProcessManager manager(cat_spec());
    manager.spawn("session-a");

    EXPECT_NO_THROW(manager.kill("session-a"));
    EXPECT_NO_THROW(manager.kill("session-a"));
    EXPECT_NO_THROW(manager.kill("never-spawned"));
    EXPECT_EQ(manager.size(), 0u);
}

TEST_F(ProcessManagerTest, KillAfterExitOnlyRemovesEntry) {
    ProcessManager manager(shell_spec("exit 3"));
    auto process = manager.spawn("short-lived");
    ASSERT_TRUE(wait_until_exited(*process, 5s));

    manager.kill("short-lived");
    EXPECT_FALSE(manager.contains("short-lived"));
    auto status = process->exit_status();
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(WIFEXITED(*status));
    EXPECT_EQ(WEXITSTATUS(*status), 3);
}

TEST_F(ProcessManagerTest, SpawnAfterKillStartsFreshProcess) {
    ProcessManager manager(cat_spec());
    auto first = manager.spawn("session-a");
    manager.kill("session-a");

    auto second = manager.spawn("session-a");
    EXPECT_NE(first->pid(), second->pid());
    EXPECT_TRUE(second->alive());
}

TEST_F(ProcessManagerTest, KillAllStopsEverySession) {
    ProcessManager manager(cat_spec());
    std::vector<std::shared_ptr<AnalysisProcess>> processes;
    for (const char* id : {"a", "b", "c"}) {
        processes.push_back(manager.spawn(id));
    }

    manager.kill_all();

    EXPECT_EQ(manager.size(), 0u);
    for (const auto& process : processes) {
        EXPECT_FALSE(process->alive());
    }
}
