#include "herder_exception.hpp"
#include "spawner.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace herder;
using namespace std::chrono_literals;

namespace {

// Real process table that remembers what it was asked to send
class recording_process_table : public process_table {
public:
    bool alive(pid_t pid) const override { return real_.alive(pid); }
    std::size_t count_children(pid_t pid) const override { return real_.count_children(pid); }

    bool send_signal(pid_t pid, int signo) noexcept override
    {
        {
            std::lock_guard lock(mutex_);
            sent_.emplace_back(pid, signo);
        }
        return real_.send_signal(pid, signo);
    }

    std::vector<std::pair<pid_t, int>> sent() const
    {
        std::lock_guard lock(mutex_);
        return sent_;
    }

private:
    proc_process_table real_;
    mutable std::mutex mutex_;
    std::vector<std::pair<pid_t, int>> sent_;
};

} // namespace

class SpawnerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir = std::filesystem::temp_directory_path() / "herder_spawner_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir); }

    std::string script(const std::string &name, const std::string &body,
                       std::filesystem::perms perms = std::filesystem::perms::owner_all)
    {
        const auto path = test_dir / name;
        {
            std::ofstream out(path);
            out << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path, perms);
        return path.string();
    }

    settings make_settings(const std::string &binary)
    {
        settings s(command_spec(custom_unicorn{binary}));
        s.pidfile = (test_dir / "server.pid").string();
        s.boot_timeout = 5s;
        s.spawn_poll_interval = 10ms;
        s.kill_grace = 500ms;
        return s;
    }

    std::filesystem::path test_dir;
    supervisor_state state;
    pid_registry registry;
    recording_process_table processes;
    signal_relay relay{state, processes, SIGUSR2};
};

TEST_F(SpawnerTest, SuccessfulDaemonizeReleasesForegroundPidAndInstallsRelay)
{
    const auto s = make_settings(script("ok.sh", "exit 0"));
    spawner sp(s, registry, processes, relay);

    EXPECT_TRUE(sp.spawn());

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(relay.installed());
    EXPECT_TRUE(processes.sent().empty());
}

TEST_F(SpawnerTest, PassesDaemonizeFlagPidfileAndArguments)
{
    const auto argsfile = test_dir / "args.txt";
    auto s = make_settings(script("echo.sh", "echo \"$@\" > \"" + argsfile.string() + "\""));
    s.args = {"-c", "config/unicorn.rb"};
    spawner sp(s, registry, processes, relay);

    ASSERT_TRUE(sp.spawn());

    std::ifstream in(argsfile);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "-D -P " + s.pidfile + " -c config/unicorn.rb");
}

TEST_F(SpawnerTest, RegistryHoldsForegroundPidWhileBooting)
{
    const auto s = make_settings(script("slowboot.sh", "sleep 1"));
    spawner sp(s, registry, processes, relay);

    std::atomic<bool> done{false};
    std::atomic<std::size_t> max_seen{0};
    std::thread sampler([&] {
        while (!done) {
            max_seen = std::max(max_seen.load(), registry.size());
            std::this_thread::sleep_for(10ms);
        }
    });

    const bool ok = sp.spawn();
    done = true;
    sampler.join();

    EXPECT_TRUE(ok);
    EXPECT_EQ(max_seen.load(), 1u);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(SpawnerTest, BootTimeoutTerminatesForegroundProcess)
{
    auto s = make_settings(script("stuck.sh", "exec sleep 30"));
    s.boot_timeout = 200ms;
    spawner sp(s, registry, processes, relay);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(sp.spawn());
    EXPECT_GE(std::chrono::steady_clock::now() - start, s.boot_timeout);

    const auto sent = processes.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_GT(sent[0].first, 0);
    EXPECT_EQ(sent[0].second, SIGTERM);
    EXPECT_FALSE(processes.alive(sent[0].first));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(relay.installed());
}

TEST_F(SpawnerTest, FailingForegroundProcessIsReportedAsFailure)
{
    const auto s = make_settings(script("fail.sh", "exit 3"));
    spawner sp(s, registry, processes, relay);

    EXPECT_FALSE(sp.spawn());

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(relay.installed());
}

TEST_F(SpawnerTest, MissingExecutableIsReportedAsFailure)
{
    const auto s = make_settings((test_dir / "no-such-unicorn").string());
    spawner sp(s, registry, processes, relay);

    EXPECT_FALSE(sp.spawn());

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(relay.installed());
}

TEST_F(SpawnerTest, OtherLaunchErrorsPropagate)
{
    const auto s = make_settings(script("noexec.sh", "exit 0", std::filesystem::perms::owner_read));
    spawner sp(s, registry, processes, relay);

    EXPECT_THROW(sp.spawn(), herder_exception);
    EXPECT_EQ(registry.size(), 0u);
}
