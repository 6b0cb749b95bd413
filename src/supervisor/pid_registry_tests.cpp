#include "pid_registry.hpp"
#include <csignal>
#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <stdexcept>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

using namespace herder;
using namespace std::chrono_literals;

namespace {

enum class ending { uncaught_exception, exit_call };

// Runs in a forked supervisor: registers a paused child, installs the reaper,
// reports the child's PID through the pipe and dies the requested way.
[[noreturn]] void supervise_and_die(int report_fd, ending how)
{
    static pid_registry registry;

    pid_t victim = ::fork();
    if (victim == 0) {
        ::close(report_fd);
        for (;;)
            ::pause();
    }

    registry.add(victim);
    install_emergency_reaper(registry);

    (void)!::write(report_fd, &victim, sizeof(victim));
    ::close(report_fd);

    if (how == ending::exit_call)
        std::exit(3);

    std::thread([] { throw std::runtime_error("uncaught in supervisor"); }).join();
    std::abort();
}


// Reaps a reparented grandchild; kills it if it is still around after the timeout
int reap_orphan(pid_t pid, std::chrono::milliseconds timeout)
{
    int status = 0;
    const auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (::waitpid(pid, &status, WNOHANG) == pid)
            return status;
        std::this_thread::sleep_for(10ms);
    }

    ::kill(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
    return -1;
}

} // namespace

class PidRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }

    pid_registry registry;
};

TEST_F(PidRegistryTest, AddRemoveContains)
{
    EXPECT_EQ(registry.size(), 0u);

    registry.add(100);
    registry.add(200);
    registry.add(100);

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains(100));
    EXPECT_TRUE(registry.contains(200));

    registry.remove(100);
    EXPECT_FALSE(registry.contains(100));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(PidRegistryTest, RemovingUnknownPidIsHarmless)
{
    registry.add(1234);
    registry.remove(4321);

    EXPECT_EQ(registry.snapshot(), std::vector<pid_t>{1234});
}

TEST_F(PidRegistryTest, KillAllKillsLiveProcesses)
{
    pid_t pid = ::fork();
    if (pid == 0) {
        ::pause();
        ::_exit(0);
    }
    ASSERT_GT(pid, 0);

    registry.add(pid);
    registry.kill_all();

    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

TEST_F(PidRegistryTest, KillAllToleratesVanishedProcesses)
{
    pid_t pid = ::fork();
    if (pid == 0)
        ::_exit(0);
    ASSERT_EQ(::waitpid(pid, nullptr, 0), pid);

    registry.add(pid);
    EXPECT_NO_THROW(registry.kill_all());
    // entries stay until responsibility is released explicitly
    EXPECT_TRUE(registry.contains(pid));
}

TEST_F(PidRegistryTest, ConcurrentMutationIsSafe)
{
    std::thread writer([this] {
        for (pid_t pid = 1000000; pid < 1001000; ++pid) {
            registry.add(pid);
            registry.remove(pid);
        }
    });

    for (int i = 0; i < 1000; ++i)
        for (pid_t pid: registry.snapshot())
            EXPECT_GE(pid, 1000000);

    writer.join();
    EXPECT_EQ(registry.size(), 0u);
}

// ==================================================================================

class EmergencyReaperTest : public ::testing::Test {
protected:
    // orphaned grandchildren are reparented to us so their fate can be checked
    void SetUp() override { ASSERT_EQ(::prctl(PR_SET_CHILD_SUBREAPER, 1), 0); }
    void TearDown() override { ::prctl(PR_SET_CHILD_SUBREAPER, 0); }

    // Returns the supervisor's wait status and the victim's (-1: survived)
    std::pair<int, int> run_supervisor(ending how)
    {
        int fds[2];
        if (::pipe(fds) != 0)
            return {-1, -1};

        pid_t supervisor = ::fork();
        if (supervisor == 0) {
            ::close(fds[0]);
            supervise_and_die(fds[1], how);
        }
        ::close(fds[1]);

        pid_t victim = 0;
        const ssize_t got = ::read(fds[0], &victim, sizeof(victim));
        ::close(fds[0]);

        int supervisor_status = 0;
        ::waitpid(supervisor, &supervisor_status, 0);
        if (got != static_cast<ssize_t>(sizeof(victim)) || victim <= 0)
            return {supervisor_status, -1};

        return {supervisor_status, reap_orphan(victim, 5s)};
    }
};

TEST_F(EmergencyReaperTest, UncaughtExceptionKillsRegisteredProcesses)
{
    const auto [supervisor, victim] = run_supervisor(ending::uncaught_exception);

    EXPECT_TRUE(WIFSIGNALED(supervisor));
    EXPECT_EQ(WTERMSIG(supervisor), SIGABRT);
    ASSERT_NE(victim, -1) << "registered process survived the supervisor";
    EXPECT_TRUE(WIFSIGNALED(victim));
    EXPECT_EQ(WTERMSIG(victim), SIGKILL);
}

TEST_F(EmergencyReaperTest, ExitKillsRegisteredProcesses)
{
    const auto [supervisor, victim] = run_supervisor(ending::exit_call);

    EXPECT_TRUE(WIFEXITED(supervisor));
    EXPECT_EQ(WEXITSTATUS(supervisor), 3);
    ASSERT_NE(victim, -1) << "registered process survived the supervisor";
    EXPECT_TRUE(WIFSIGNALED(victim));
    EXPECT_EQ(WTERMSIG(victim), SIGKILL);
}
