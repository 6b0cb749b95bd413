#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace herder {

// Server flavors started by name from PATH
enum class server_flavor { unicorn, unicorn_rails, gunicorn, gunicorn_django };

// Throws std::invalid_argument for anything outside the closed set
[[nodiscard]] server_flavor parse_flavor(const std::string &name);
[[nodiscard]] std::string_view to_string(server_flavor flavor);

struct builtin_server {
    server_flavor flavor;
};

// unicorn-compatible server at an explicit path
struct custom_unicorn {
    std::string binary;
};

// gunicorn-compatible server at an explicit path
struct custom_gunicorn {
    std::string binary;
};

// How to launch the managed server in daemonizing mode
class command_spec {
public:
    using server_type = std::variant<builtin_server, custom_unicorn, custom_gunicorn>;

    explicit command_spec(server_type server);

    // A custom binary wins over the flavor name; an unknown flavor without
    // one throws std::invalid_argument.
    static command_spec from_names(const std::string &flavor, const std::string &unicorn_bin,
                                   const std::string &gunicorn_bin);

    // flavor name or custom binary path, used in log messages
    std::string name() const;
    std::string default_pidfile() const;

    std::vector<std::string> argv(const std::string &pidfile, const std::vector<std::string> &args) const;

    // asks the running master to fork a replacement of itself
    int reload_signal() const noexcept;

    const server_type &server() const { return server_; }

private:
    server_type server_;
};

} // namespace herder
