#pragma once
#include "pid_registry.hpp"
#include "process_table.hpp"
#include "settings.hpp"
#include "signal_relay.hpp"

namespace herder {

// Starts the managed server in daemonizing mode
class spawner {
public:
    spawner(const settings &s, pid_registry &registry, process_table &processes, signal_relay &relay);

    spawner(const spawner &) = delete;
    spawner &operator=(const spawner &) = delete;

    // Launches the server and waits up to boot_timeout for the foreground process
    // to exit after forking the detached master. Returns false when the executable
    // is missing, the boot times out or the foreground process fails; throws
    // herder_exception for any other launch error. Installs the signal relay on success.
    bool spawn();

private:
    // waits for the foreground process; false on boot timeout
    bool wait_for_daemonize(pid_t pid, int &status);
    void reap_after_terminate(pid_t pid);

    const settings &settings_;
    pid_registry &registry_;
    process_table &processes_;
    signal_relay &relay_;
};

} // namespace herder
