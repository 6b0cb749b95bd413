#pragma once
#include "process_table.hpp"
#include "settings.hpp"
#include <cstddef>

namespace herder {

enum class worker_wait { ready, timed_out };

// Retires the old master once the master it forked has its workers up
class reload_coordinator {
public:
    explicit reload_coordinator(const settings &s);

    // Worker count the new master must reach: the old master's children minus
    // the new master itself, at least one.
    static std::size_t expected_workers(const process_handle &old_master);

    // Polls until new_master has expected_workers(old_master) children, then holds
    // for the overlap window. Gives up after max_worker_wait_time without the overlap:
    // a smaller pool may be intentional and must not keep the old master alive.
    worker_wait wait_for_workers(const process_handle &old_master, const process_handle &new_master) const;

    // SIGWINCH stops the workers under both unicorn and gunicorn conventions; the
    // final SIGQUIT then finishes the master whichever meaning it gives to QUIT.
    void kill_old_master(const process_handle &old_master) const;

    void handover(const process_handle &old_master, const process_handle &new_master) const;

private:
    const settings &settings_;
};

} // namespace herder
