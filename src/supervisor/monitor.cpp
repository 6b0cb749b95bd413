#include "monitor.hpp"
#include "deadline.hpp"
#include "herder_exception.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace herder {

monitor::monitor(settings s, pid_registry &registry, process_table &processes)
    : settings_(std::move(s)),
      registry_(registry),
      processes_(processes),
      pidfile_(settings_.pidfile),
      relay_(state_, processes_, settings_.command.reload_signal()),
      coordinator_(settings_),
      spawner_(settings_, registry_, processes_, relay_)
{ }


bool monitor::spawn()
{
    return spawner_.spawn();
}


int monitor::loop()
{
    for (;;) {
        if (loop_once() == iteration::gone) {
            if (state_.terminating) {
                spdlog::info("{} exited after shutdown request. Exiting.", settings_.command.name());
                return EXIT_SUCCESS;
            }
            // The unicorn has died. So should we.
            spdlog::error("{} died. Exiting.", settings_.command.name());
            return EXIT_FAILURE;
        }
        std::this_thread::sleep_for(settings_.loop_interval);
    }
}


iteration monitor::loop_once()
{
    const pid_t old_pid = state_.master.load();

    const auto pid = read_pidfile();
    if (!pid || !processes_.alive(*pid)) {
        // a dead master's PID may be reused before the exit handlers run
        if (old_pid != 0 && !processes_.alive(old_pid))
            registry_.remove(old_pid);
        return iteration::gone;
    }

    state_.master = *pid;

    if (old_pid == 0) {
        spdlog::info("{} booted (PID {})", settings_.command.name(), *pid);
        registry_.add(*pid);
    } else if (*pid != old_pid) {
        spdlog::info("{} changed PID (was {}, now {})", settings_.command.name(), old_pid, *pid);
        registry_.add(*pid);

        if (state_.reloading) {
            coordinator_.handover(process_handle(old_pid, processes_), process_handle(*pid, processes_));
            state_.reloading = false;
        }

        // an unrequested replacement still moves kill responsibility to the new master
        registry_.remove(old_pid);
    }

    return iteration::alive;
}


std::optional<pid_t> monitor::master() const
{
    const pid_t pid = state_.master.load();
    if (pid == 0)
        return std::nullopt;
    return pid;
}


std::optional<pid_t> monitor::read_pidfile()
{
    const deadline readable(settings_.pidfile_timeout);

    for (;;) {
        try {
            return pidfile_.read();
        } catch (const pidfile_error &e) {
            // expected while the server shuts down on our request
            if (state_.terminating)
                return std::nullopt;

            spdlog::debug("Got an error while attempting to read pidfile: {}", e.what());
            if (!readable.sleep_for(settings_.pidfile_retry_interval))
                break;
            spdlog::debug("This is usually not fatal. Retrying...");
        }
    }

    throw herder_exception(fmt::format("Failed to read pidfile {} after {} seconds, aborting!",
                                       pidfile_.path().string(),
                                       std::chrono::duration<double>(settings_.pidfile_timeout).count()));
}

} // namespace herder
