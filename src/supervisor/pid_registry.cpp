#include "pid_registry.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>

namespace herder {

void pid_registry::add(pid_t pid)
{
    std::lock_guard lock(mutex_);
    pids_.insert(pid);
}


void pid_registry::remove(pid_t pid)
{
    std::lock_guard lock(mutex_);
    pids_.erase(pid);
}


bool pid_registry::contains(pid_t pid) const
{
    std::lock_guard lock(mutex_);
    return pids_.find(pid) != pids_.end();
}


std::size_t pid_registry::size() const
{
    std::lock_guard lock(mutex_);
    return pids_.size();
}


std::vector<pid_t> pid_registry::snapshot() const
{
    std::lock_guard lock(mutex_);
    return std::vector<pid_t>(pids_.begin(), pids_.end());
}


void pid_registry::kill_all() noexcept
{
    std::vector<pid_t> pids;
    {
        std::lock_guard lock(mutex_);
        pids.assign(pids_.begin(), pids_.end());
    }

    for (pid_t pid: pids)
        if (pid > 0)
            // ESRCH: already exited and reaped
            ::kill(pid, SIGKILL);
}


namespace {

std::atomic<pid_registry *> reaper_registry{nullptr};
std::terminate_handler previous_terminate = nullptr;

void reap_registry()
{
    if (pid_registry *registry = reaper_registry.load())
        registry->kill_all();
}

[[noreturn]] void reap_and_terminate()
{
    reap_registry();
    if (previous_terminate)
        previous_terminate();
    std::abort();
}

} // namespace


void install_emergency_reaper(pid_registry &registry)
{
    if (reaper_registry.exchange(&registry) != nullptr)
        // hooks are already in place, only the target changed
        return;

    std::atexit(reap_registry);
    previous_terminate = std::set_terminate(reap_and_terminate);
}

} // namespace herder
