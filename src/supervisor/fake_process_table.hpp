#pragma once
#include "process_table.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace herder::testing {

// In-memory process_table for tests; records every signal sent
class fake_process_table : public process_table {
public:
    struct sent_signal {
        pid_t pid;
        int signo;
        std::chrono::steady_clock::time_point at;
    };

    void spawn(pid_t pid, std::size_t children = 0)
    {
        std::lock_guard lock(mutex_);
        live_.insert(pid);
        children_[pid] = children;
    }

    void exit(pid_t pid)
    {
        std::lock_guard lock(mutex_);
        live_.erase(pid);
        children_.erase(pid);
    }

    void set_children(pid_t pid, std::size_t children)
    {
        std::lock_guard lock(mutex_);
        children_[pid] = children;
    }

    bool alive(pid_t pid) const override
    {
        std::lock_guard lock(mutex_);
        return live_.count(pid) != 0;
    }

    std::size_t count_children(pid_t pid) const override
    {
        std::lock_guard lock(mutex_);
        ++child_queries_;
        auto it = children_.find(pid);
        return it == children_.end() ? 0 : it->second;
    }

    bool send_signal(pid_t pid, int signo) noexcept override
    {
        std::lock_guard lock(mutex_);
        signals_.push_back({pid, signo, std::chrono::steady_clock::now()});
        return live_.count(pid) != 0;
    }

    std::vector<sent_signal> signals() const
    {
        std::lock_guard lock(mutex_);
        return signals_;
    }

    std::vector<int> signals_to(pid_t pid) const
    {
        std::lock_guard lock(mutex_);
        std::vector<int> result;
        for (const auto &s: signals_)
            if (s.pid == pid)
                result.push_back(s.signo);
        return result;
    }

    std::size_t child_queries() const
    {
        std::lock_guard lock(mutex_);
        return child_queries_;
    }

private:
    mutable std::mutex mutex_;
    std::set<pid_t> live_;
    std::map<pid_t, std::size_t> children_;
    std::vector<sent_signal> signals_;
    mutable std::size_t child_queries_ = 0;
};

} // namespace herder::testing
