#include "reload_coordinator.hpp"
#include "deadline.hpp"
#include <algorithm>
#include <chrono>
#include <csignal>
#include <spdlog/spdlog.h>
#include <thread>

namespace herder {

namespace {

double seconds(std::chrono::milliseconds d)
{
    return std::chrono::duration<double>(d).count();
}

} // namespace


reload_coordinator::reload_coordinator(const settings &s)
    : settings_(s)
{ }


std::size_t reload_coordinator::expected_workers(const process_handle &old_master)
{
    const std::size_t children = old_master.children();
    return std::max<std::size_t>(children > 0 ? children - 1 : 0, 1);
}


worker_wait reload_coordinator::wait_for_workers(const process_handle &old_master,
                                                 const process_handle &new_master) const
{
    const std::size_t expected = expected_workers(old_master);
    const deadline workers_up(settings_.max_worker_wait_time);

    while (new_master.children() < expected) {
        if (workers_up.expired()) {
            spdlog::warn("The expected number of workers ({}) was not reached in {} seconds for PID {}, continuing "
                         "with shutdown",
                         expected, seconds(settings_.max_worker_wait_time), new_master.pid());
            return worker_wait::timed_out;
        }
        workers_up.sleep_for(settings_.worker_poll_interval);
    }

    spdlog::debug("Found {} child processes for PID {}, old processes will be stopped in {} seconds", expected,
                  new_master.pid(), seconds(settings_.overlap));
    std::this_thread::sleep_for(settings_.overlap);
    return worker_wait::ready;
}


void reload_coordinator::kill_old_master(const process_handle &old_master) const
{
    spdlog::debug("Sending WINCH to old master (PID {})", old_master.pid());
    old_master.send_signal(SIGWINCH);
    std::this_thread::sleep_for(settings_.kill_grace);
    spdlog::debug("Sending QUIT to old master (PID {})", old_master.pid());
    old_master.send_signal(SIGQUIT);
}


void reload_coordinator::handover(const process_handle &old_master, const process_handle &new_master) const
{
    wait_for_workers(old_master, new_master);
    kill_old_master(old_master);
}

} // namespace herder
