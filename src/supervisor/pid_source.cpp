#include "pid_source.hpp"
#include "herder_exception.hpp"
#include "utils/string.hpp"
#include <cerrno>
#include <charconv>
#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <string>

namespace herder {

pid_source::pid_source(std::filesystem::path path)
    : path_(std::move(path))
{ }


pid_t pid_source::read() const
{
    errno = 0;
    std::ifstream in(path_);
    if (!in) {
        const int err = errno;
        throw pidfile_error(pidfile_error::kind::transient,
                            fmt::format("cannot open pidfile {}: {}", path_.string(),
                                        err != 0 ? utils::string::str_err(err) : "unknown error"));
    }

    const std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
        throw pidfile_error(pidfile_error::kind::transient, fmt::format("cannot read pidfile {}", path_.string()));

    const auto first = content.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        // the server truncates before writing
        throw pidfile_error(pidfile_error::kind::transient, fmt::format("pidfile {} is empty", path_.string()));
    const auto last = content.find_last_not_of(" \t\r\n");

    const char *begin = content.data() + first;
    const char *end = content.data() + last + 1;
    long value = 0;
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value <= 0 || static_cast<pid_t>(value) != value)
        throw pidfile_error(pidfile_error::kind::malformed,
                            fmt::format("pidfile {} does not contain a PID: '{}'", path_.string(),
                                        std::string(begin, end)));

    return static_cast<pid_t>(value);
}

} // namespace herder
