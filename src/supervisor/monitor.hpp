#pragma once
#include "pid_registry.hpp"
#include "pid_source.hpp"
#include "process_table.hpp"
#include "reload_coordinator.hpp"
#include "settings.hpp"
#include "signal_relay.hpp"
#include "spawner.hpp"
#include <optional>

namespace herder {

// Outcome of one monitor loop pass
enum class iteration { alive, gone };

// Supervises one managed server: spawns it, follows its master through the
// pidfile and retires the old master after a requested reload.
//
//   no master -> booted -> (steady <-> reloading) -> gone
class monitor {
public:
    monitor(settings s, pid_registry &registry, process_table &processes);

    monitor(const monitor &) = delete;
    monitor &operator=(const monitor &) = delete;

    bool spawn();

    // Runs until the master disappears. Returns EXIT_SUCCESS after an operator
    // initiated shutdown and EXIT_FAILURE when the master died on its own.
    // Throws herder_exception when the pidfile stays unreadable for pidfile_timeout.
    int loop();

    iteration loop_once();

    std::optional<pid_t> master() const;
    supervisor_state &state() { return state_; }
    const settings &config() const { return settings_; }

private:
    // nullopt once shutdown was requested and the pidfile is gone
    std::optional<pid_t> read_pidfile();

    settings settings_;
    pid_registry &registry_;
    process_table &processes_;
    supervisor_state state_;
    pid_source pidfile_;
    signal_relay relay_;
    reload_coordinator coordinator_;
    spawner spawner_;
};

} // namespace herder
