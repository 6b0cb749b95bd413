#include "process_table.hpp"
#include "utils/string.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>

namespace herder {

namespace {

struct stat_fields {
    char state;
    pid_t ppid;
};

// /proc/<pid>/stat is "pid (comm) state ppid ..."; comm may itself contain
// spaces and parentheses, so fields are located after the last ')'.
std::optional<stat_fields> read_stat(const std::filesystem::path &stat_path)
{
    std::ifstream in(stat_path);
    std::string line;
    if (!in || !std::getline(in, line))
        return std::nullopt;

    const auto paren = line.rfind(')');
    if (paren == std::string::npos || paren + 2 >= line.size())
        return std::nullopt;

    const char *cursor = line.c_str() + paren + 2;
    stat_fields fields{};
    fields.state = *cursor;
    char *end = nullptr;
    const long ppid = std::strtol(cursor + 1, &end, 10);
    if (end == cursor + 1)
        return std::nullopt;
    fields.ppid = static_cast<pid_t>(ppid);
    return fields;
}


bool is_pid_name(const std::string &name)
{
    if (name.empty())
        return false;
    for (char c: name)
        if (c < '0' || c > '9')
            return false;
    return true;
}

} // namespace


proc_process_table::proc_process_table(std::filesystem::path proc_root)
    : proc_root_(std::move(proc_root))
{ }


bool proc_process_table::alive(pid_t pid) const
{
    if (pid <= 0)
        return false;

    if (::kill(pid, 0) != 0 && errno != EPERM)
        return false;

    const auto fields = read_stat(proc_root_ / std::to_string(pid) / "stat");
    if (!fields)
        // exited between kill() and the read
        return false;
    return fields->state != 'Z' && fields->state != 'X';
}


std::size_t proc_process_table::count_children(pid_t pid) const
{
    std::size_t children = 0;
    std::error_code ec;
    std::filesystem::directory_iterator it(proc_root_, ec);
    if (ec) {
        spdlog::warn("Cannot list {}: {}", proc_root_.string(), ec.message());
        return 0;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        const auto name = it->path().filename().string();
        if (!is_pid_name(name))
            continue;
        // entries vanish while iterating; those simply do not count
        const auto fields = read_stat(it->path() / "stat");
        if (fields && fields->ppid == pid && fields->state != 'Z' && fields->state != 'X')
            ++children;
    }
    return children;
}


bool proc_process_table::send_signal(pid_t pid, int signo) noexcept
{
    if (pid <= 0)
        return false;

    if (::kill(pid, signo) == 0)
        return true;

    const int err = errno;
    if (err == ESRCH)
        spdlog::debug("Not sending signal {} to PID {}: process is gone", signo, pid);
    else
        spdlog::warn("Failed to send signal {} to PID {}: {}", signo, pid, utils::string::str_err(err));
    return false;
}

} // namespace herder
