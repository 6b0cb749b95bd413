#pragma once
#include <cstddef>
#include <mutex>
#include <set>
#include <sys/types.h>
#include <vector>

namespace herder {

// PIDs the supervisor must kill if it exits abnormally. Mutated by the spawner
// and the monitor loop, read by the emergency reaper.
class pid_registry {
public:
    pid_registry() = default;

    pid_registry(const pid_registry &) = delete;
    pid_registry &operator=(const pid_registry &) = delete;

    void add(pid_t pid);
    void remove(pid_t pid);
    bool contains(pid_t pid) const;
    std::size_t size() const;
    std::vector<pid_t> snapshot() const;

    // SIGKILL every registered PID; processes already gone are skipped
    void kill_all() noexcept;

private:
    mutable std::mutex mutex_;
    std::set<pid_t> pids_;
};

// Reaps the registry at process exit and from std::terminate. The registry
// must outlive every exit handler, i.e. have static storage duration.
void install_emergency_reaper(pid_registry &registry);

} // namespace herder
