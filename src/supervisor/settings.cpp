#include "settings.hpp"
#include "cfg2/config.hpp"
#include "utils/string.hpp"

namespace herder {

settings settings::from_config(const cfg2::HerderSection &section)
{
    settings s(command_spec::from_names(section.unicorn, section.unicorn_bin, section.gunicorn_bin));

    if (!section.pidfile.empty())
        s.pidfile = section.pidfile;
    s.args = utils::string::split_args(section.args);
    s.boot_timeout = std::chrono::seconds(section.boot_timeout);
    s.pidfile_timeout = std::chrono::seconds(section.pidfile_timeout);
    s.overlap = std::chrono::seconds(section.overlap);
    s.max_worker_wait_time = std::chrono::seconds(section.max_worker_wait_time);

    return s;
}

} // namespace herder
