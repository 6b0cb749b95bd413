#pragma once
#include "command.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <sys/types.h>
#include <vector>

namespace cfg2 {
struct HerderSection;
}

namespace herder {

struct settings {
    explicit settings(command_spec cmd)
        : command(std::move(cmd)), pidfile(command.default_pidfile())
    { }

    // Throws std::invalid_argument for an unknown server flavor or unsplittable args
    static settings from_config(const cfg2::HerderSection &section);

    command_spec command;
    std::string pidfile;
    std::vector<std::string> args;

    std::chrono::milliseconds boot_timeout = std::chrono::seconds(180);
    std::chrono::milliseconds pidfile_timeout = std::chrono::seconds(180);
    std::chrono::milliseconds overlap = std::chrono::seconds(180);
    std::chrono::milliseconds max_worker_wait_time = std::chrono::seconds(180);

    // fixed intervals; tests shorten them
    std::chrono::milliseconds loop_interval = std::chrono::seconds(2);
    std::chrono::milliseconds pidfile_retry_interval = std::chrono::seconds(1);
    std::chrono::milliseconds worker_poll_interval = std::chrono::seconds(1);
    std::chrono::milliseconds kill_grace = std::chrono::seconds(1);
    std::chrono::milliseconds spawn_poll_interval = std::chrono::milliseconds(100);
};


// Shared between the monitor loop and the signal relay thread
struct supervisor_state {
    std::atomic<pid_t> master{0}; // 0: no master tracked yet
    std::atomic<bool> reloading{false};
    std::atomic<bool> terminating{false};

    static_assert(std::atomic<pid_t>::is_always_lock_free);
};

} // namespace herder
