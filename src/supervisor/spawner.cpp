#include "spawner.hpp"
#include "deadline.hpp"
#include "herder_exception.hpp"
#include "utils/string.hpp"
#include <cerrno>
#include <csignal>
#include <fmt/core.h>
#include <spawn.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>

extern char **environ;

namespace herder {

namespace {

// posix_spawnattr_t owner
class spawn_attributes {
public:
    spawn_attributes()
    {
        if (int rc = posix_spawnattr_init(&attr_); rc != 0)
            throw herder_exception(fmt::format("posix_spawnattr_init failed: {}", utils::string::str_err(rc)));
    }

    ~spawn_attributes() { posix_spawnattr_destroy(&attr_); }

    spawn_attributes(const spawn_attributes &) = delete;
    spawn_attributes &operator=(const spawn_attributes &) = delete;

    // The server must not inherit the relay's blocked mask or our dispositions
    void reset_signals(const sigset_t &defaults)
    {
        sigset_t empty;
        sigemptyset(&empty);
        check(posix_spawnattr_setsigmask(&attr_, &empty), "posix_spawnattr_setsigmask");
        check(posix_spawnattr_setsigdefault(&attr_, &defaults), "posix_spawnattr_setsigdefault");
        check(posix_spawnattr_setflags(&attr_, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF),
              "posix_spawnattr_setflags");
    }

    const posix_spawnattr_t *get() const { return &attr_; }

private:
    static void check(int rc, const char *what)
    {
        if (rc != 0)
            throw herder_exception(fmt::format("{} failed: {}", what, utils::string::str_err(rc)));
    }

    posix_spawnattr_t attr_;
};


std::string describe_status(int status)
{
    if (WIFEXITED(status))
        return fmt::format("exit status {}", WEXITSTATUS(status));
    if (WIFSIGNALED(status))
        return fmt::format("signal {}", WTERMSIG(status));
    return fmt::format("wait status {}", status);
}

} // namespace


spawner::spawner(const settings &s, pid_registry &registry, process_table &processes, signal_relay &relay)
    : settings_(s), registry_(registry), processes_(processes), relay_(relay)
{ }


bool spawner::spawn()
{
    const std::string name = settings_.command.name();
    const std::vector<std::string> args = settings_.command.argv(settings_.pidfile, settings_.args);

    spdlog::debug("Calling {}: {}", name, utils::string::join(args));

    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg: args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGHUP);
    sigaddset(&defaults, SIGWINCH);
    for (int signo: signal_relay::forwarded_signals())
        sigaddset(&defaults, signo);

    spawn_attributes attributes;
    attributes.reset_signals(defaults);

    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, argv[0], nullptr, attributes.get(), argv.data(), environ);
    if (rc == ENOENT) {
        spdlog::error("Command '{}' not found. Is it installed?", args.front());
        return false;
    }
    if (rc != 0)
        throw herder_exception(fmt::format("Failed to launch '{}': {}", args.front(), utils::string::str_err(rc)));

    // until the foreground process exits we are responsible for it
    registry_.add(pid);

    int status = 0;
    if (!wait_for_daemonize(pid, status)) {
        spdlog::error("{} failed to daemonize within {} seconds. Sending TERM and exiting.", name,
                      std::chrono::duration<double>(settings_.boot_timeout).count());
        processes_.send_signal(pid, SIGTERM);
        registry_.remove(pid);
        reap_after_terminate(pid);
        return false;
    }

    // If we got this far the foreground process is gone and the detached
    // master is picked up from the pidfile by the monitor loop.
    registry_.remove(pid);

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        spdlog::error("{} failed to daemonize: foreground process (PID {}) ended with {}", name, pid,
                      describe_status(status));
        return false;
    }

    spdlog::debug("{} daemonized (foreground PID {} exited)", name, pid);

    // The relay only starts once there is a server to forward to
    relay_.install();
    return true;
}


bool spawner::wait_for_daemonize(pid_t pid, int &status)
{
    const deadline boot(settings_.boot_timeout);
    for (;;) {
        const pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid)
            return true;
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            throw herder_exception(
                fmt::format("waitpid({}) failed: {}", pid, utils::string::str_err(errno)));
        }
        if (!boot.sleep_for(settings_.spawn_poll_interval))
            return false;
    }
}


void spawner::reap_after_terminate(pid_t pid)
{
    const deadline grace(settings_.kill_grace);
    int status = 0;
    do {
        const pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            spdlog::debug("Foreground process (PID {}) ended with {}", pid, describe_status(status));
            return;
        }
        if (rc < 0 && errno != EINTR)
            return;
    } while (grace.sleep_for(settings_.spawn_poll_interval));
    spdlog::warn("Foreground process (PID {}) did not exit after TERM", pid);
}

} // namespace herder
