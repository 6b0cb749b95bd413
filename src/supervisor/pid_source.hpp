#pragma once
#include <filesystem>
#include <sys/types.h>

namespace herder {

// Reads the master PID the managed server writes to its pidfile
class pid_source {
public:
    explicit pid_source(std::filesystem::path path);

    // Throws pidfile_error: transient when the file is missing, unreadable or
    // empty (not written yet), malformed when it holds anything but a positive PID.
    pid_t read() const;

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace herder
