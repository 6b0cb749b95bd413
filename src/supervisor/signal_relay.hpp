#pragma once

#include "process_table.hpp"
#include "settings.hpp"
#include <atomic>
#include <csignal>
#include <thread>
#include <vector>

namespace herder {

// Relays operator signals to the tracked master from a dedicated sigwait() thread.
// - SIGHUP: set reloading and ask the master to fork a replacement
// - SIGINT/SIGQUIT/SIGTERM: set terminating, then forward
// - SIGTTIN/SIGTTOU/SIGUSR1/SIGUSR2: forward
// SIGWINCH is never forwarded: a terminal resize would make the server drop its workers.
class signal_relay {
public:
    signal_relay(supervisor_state &state, process_table &processes, int reload_signal);
    ~signal_relay();

    signal_relay(const signal_relay &) = delete;
    signal_relay &operator=(const signal_relay &) = delete;

    // Blocks the handled signals in the calling thread and starts the consumer.
    // Call before any other thread is started. No-op when already installed.
    void install();
    void uninstall();
    bool installed() const { return signal_thread_.joinable(); }

    // Acts on one delivered signal: flag updates and a single send, nothing else
    void dispatch(int signo);

    static const std::vector<int> &forwarded_signals();

private:
    void signalLoop(sigset_t set);

    supervisor_state &state_;
    process_table &processes_;
    int reload_signal_;
    std::atomic<bool> running_{false};
    std::thread signal_thread_;
    sigset_t old_set_{}; // previous thread signal mask
};

} // namespace herder
