#include "command.hpp"
#include <csignal>
#include <stdexcept>
#include <type_traits>

namespace herder {

namespace {

template<class> inline constexpr bool always_false_v = false;

} // namespace


server_flavor parse_flavor(const std::string &name)
{
    if (name == "unicorn")
        return server_flavor::unicorn;
    if (name == "unicorn_rails")
        return server_flavor::unicorn_rails;
    if (name == "gunicorn")
        return server_flavor::gunicorn;
    if (name == "gunicorn_django")
        return server_flavor::gunicorn_django;
    throw std::invalid_argument("Unknown unicorn type: " + name +
                                " (expected: unicorn, unicorn_rails, gunicorn, gunicorn_django)");
}


std::string_view to_string(server_flavor flavor)
{
    switch (flavor) {
    case server_flavor::unicorn:
        return "unicorn";
    case server_flavor::unicorn_rails:
        return "unicorn_rails";
    case server_flavor::gunicorn:
        return "gunicorn";
    case server_flavor::gunicorn_django:
        return "gunicorn_django";
    }
    __builtin_unreachable();
}


command_spec::command_spec(server_type server)
    : server_(std::move(server))
{ }


command_spec command_spec::from_names(const std::string &flavor, const std::string &unicorn_bin,
                                      const std::string &gunicorn_bin)
{
    if (!unicorn_bin.empty())
        return command_spec(custom_unicorn{unicorn_bin});
    if (!gunicorn_bin.empty())
        return command_spec(custom_gunicorn{gunicorn_bin});
    return command_spec(builtin_server{parse_flavor(flavor)});
}


std::string command_spec::name() const
{
    return std::visit(
        [](const auto &s) -> std::string {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, builtin_server>)
                return std::string(to_string(s.flavor));
            else
                return s.binary;
        },
        server_);
}


std::string command_spec::default_pidfile() const
{
    return name() + ".pid";
}


std::vector<std::string> command_spec::argv(const std::string &pidfile, const std::vector<std::string> &args) const
{
    std::vector<std::string> result = std::visit(
        [&pidfile](const auto &s) -> std::vector<std::string> {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, builtin_server>) {
                switch (s.flavor) {
                case server_flavor::unicorn:
                    return {"unicorn", "-D", "-P", pidfile};
                case server_flavor::unicorn_rails:
                    // unicorn_rails writes the pidfile named in its own config
                    return {"unicorn_rails", "-D"};
                case server_flavor::gunicorn:
                    return {"gunicorn", "-D", "-p", pidfile};
                case server_flavor::gunicorn_django:
                    return {"gunicorn_django", "-D", "-p", pidfile};
                }
                __builtin_unreachable();
            } else if constexpr (std::is_same_v<T, custom_unicorn>) {
                return {s.binary, "-D", "-P", pidfile};
            } else if constexpr (std::is_same_v<T, custom_gunicorn>) {
                return {s.binary, "-D", "-p", pidfile};
            } else {
                static_assert(always_false_v<T>, "unhandled server type");
            }
        },
        server_);

    result.insert(result.end(), args.begin(), args.end());
    return result;
}


int command_spec::reload_signal() const noexcept
{
    // unicorn and gunicorn both re-exec a new master on USR2
    return SIGUSR2;
}

} // namespace herder
