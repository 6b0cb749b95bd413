#pragma once
#include <cstddef>
#include <filesystem>
#include <sys/types.h>

namespace herder {

// OS process introspection used by the supervisor
class process_table {
public:
    virtual ~process_table() = default;

    // false for vanished and zombie processes
    virtual bool alive(pid_t pid) const = 0;

    // number of direct children
    virtual std::size_t count_children(pid_t pid) const = 0;

    // Best-effort. Returns false when the process is gone or the signal could not
    // be delivered; never throws.
    virtual bool send_signal(pid_t pid, int signo) noexcept = 0;
};


// process_table backed by kill(2) and the proc filesystem
class proc_process_table final : public process_table {
public:
    explicit proc_process_table(std::filesystem::path proc_root = "/proc");

    bool alive(pid_t pid) const override;
    std::size_t count_children(pid_t pid) const override;
    bool send_signal(pid_t pid, int signo) noexcept override;

private:
    std::filesystem::path proc_root_;
};


// A PID bound to the table that inspects it
class process_handle {
public:
    process_handle(pid_t pid, process_table &table)
        : pid_{pid}, table_{&table}
    { }

    pid_t pid() const { return pid_; }
    bool alive() const { return table_->alive(pid_); }
    std::size_t children() const { return table_->count_children(pid_); }
    bool send_signal(int signo) const noexcept { return table_->send_signal(pid_, signo); }

private:
    pid_t pid_;
    process_table *table_;
};

} // namespace herder
