#pragma once
#include <stdexcept>
#include <string>

namespace herder {

class herder_exception : public std::runtime_error {
public:
    explicit herder_exception(const std::string &desc)
        : runtime_error{desc}
    { }
};


// Thrown by pid_source::read(); the monitor loop retries both kinds
class pidfile_error : public herder_exception {
public:
    enum class kind { transient, malformed };

    pidfile_error(kind k, const std::string &desc)
        : herder_exception{desc}, kind_{k}
    { }

    kind error_kind() const noexcept { return kind_; }

private:
    kind kind_;
};

} // namespace herder
