#include "signal_relay.hpp"
#include "utils/string.hpp"
#include <cstring>
#include <fmt/core.h>
#include <pthread.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace herder {

namespace {

std::string signal_name(int signo)
{
    const char *abbrev = sigabbrev_np(signo);
    return abbrev ? std::string("SIG") + abbrev : fmt::format("signal {}", signo);
}

} // namespace


const std::vector<int> &signal_relay::forwarded_signals()
{
    static const std::vector<int> signals = {SIGINT, SIGQUIT, SIGTERM, SIGTTIN, SIGTTOU, SIGUSR1, SIGUSR2};
    return signals;
}


signal_relay::signal_relay(supervisor_state &state, process_table &processes, int reload_signal)
    : state_(state), processes_(processes), reload_signal_(reload_signal)
{ }


signal_relay::~signal_relay()
{
    uninstall();
}


void signal_relay::install()
{
    if (installed())
        return;

    // Block signals in the current thread so the dedicated thread can receive them via sigwait()
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGHUP);
    for (int signo: forwarded_signals())
        sigaddset(&set, signo);

    if (int rc = pthread_sigmask(SIG_BLOCK, &set, &old_set_); rc != 0)
        throw std::runtime_error(fmt::format("signal_relay: failed to block signals: {}", utils::string::str_err(rc)));

    running_ = true;
    signal_thread_ = std::thread([this, set]() { signalLoop(set); });
    spdlog::debug("Signals installed: SIGHUP, SIGINT, SIGQUIT, SIGTERM, SIGTTIN, SIGTTOU, SIGUSR1, SIGUSR2");
}


void signal_relay::uninstall()
{
    if (!installed())
        return;

    running_ = false;
    // Wake sigwait() so the thread can exit; ignored when !running_
    pthread_kill(signal_thread_.native_handle(), SIGHUP);
    signal_thread_.join();
    // Restore previous signal mask for this thread
    pthread_sigmask(SIG_SETMASK, &old_set_, nullptr);
}


void signal_relay::signalLoop(sigset_t set)
{
    int sig = 0;
    for (;;) {
        int rc = sigwait(&set, &sig);
        if (!running_)
            break; // ignore events during teardown
        if (rc != 0) {
            spdlog::error("signal_relay: sigwait failed: {}", utils::string::str_err(rc));
            break;
        }
        dispatch(sig);
    }
}


void signal_relay::dispatch(int signo)
{
    const pid_t master = state_.master.load();
    const std::string name = signal_name(signo);

    if (signo == SIGHUP) {
        if (master == 0) {
            spdlog::warn("Caught {} but have no tracked process.", name);
            return;
        }
        spdlog::info("Caught {}: gracefully restarting PID {}", name, master);
        state_.reloading = true;
        processes_.send_signal(master, reload_signal_);
        return;
    }

    if (master == 0) {
        spdlog::warn("Caught {} but have no tracked process.", name);
        return;
    }

    if (signo == SIGINT || signo == SIGQUIT || signo == SIGTERM) {
        spdlog::debug("Caught {}: expecting termination.", name);
        state_.terminating = true;
    }

    spdlog::debug("Forwarding {} to PID {}", name, master);
    processes_.send_signal(master, signo);
}

} // namespace herder
