#pragma once

#include "section_registry.hpp"
#include <filesystem>
#include <fmt/core.h>
#include <stdexcept>
#include <string>

namespace cfg2 {

// [general]: logging
struct GeneralSection : BaseSection {
    std::string log_type = "console";
    std::string log_facility = "daemon";
    std::string log_priority = "info";

    void validate() const
    {
        if (log_type != "console" && log_type != "syslog")
            throw std::invalid_argument("Section 'general' must set log_type to 'console' or 'syslog'");

        if (log_priority != "trace" && log_priority != "debug" && log_priority != "info" &&
            log_priority != "warning" && log_priority != "error" && log_priority != "critical")
            throw std::invalid_argument(fmt::format(
                "Section 'general' has invalid log_priority '{}' (expected: trace, debug, info, warning, error, "
                "critical)",
                log_priority));
    }
};

REGISTER_SECTION(GeneralSection, "general", field("log_type", &GeneralSection::log_type),
                 field("log_facility", &GeneralSection::log_facility),
                 field("log_priority", &GeneralSection::log_priority))

// [herder]: the managed server and the reload timings, in seconds
struct HerderSection : BaseSection {
    std::string unicorn = "gunicorn";
    std::string unicorn_bin;
    std::string gunicorn_bin;
    std::string pidfile; // empty: "<unicorn>.pid"
    std::string args;
    int boot_timeout = 180;
    int pidfile_timeout = 180;
    int overlap = 180;
    int max_worker_wait_time = 180;

    void validate() const
    {
        if (!unicorn_bin.empty() && !gunicorn_bin.empty())
            throw std::invalid_argument("Section 'herder' must not set both unicorn_bin and gunicorn_bin");

        if (boot_timeout < 0)
            throw std::invalid_argument("Section 'herder' must set boot_timeout >= 0");

        if (pidfile_timeout < 0)
            throw std::invalid_argument("Section 'herder' must set pidfile_timeout >= 0");

        if (overlap < 0)
            throw std::invalid_argument("Section 'herder' must set overlap >= 0");

        if (max_worker_wait_time < 0)
            throw std::invalid_argument("Section 'herder' must set max_worker_wait_time >= 0");
    }
};

REGISTER_SECTION(HerderSection, "herder", field("unicorn", &HerderSection::unicorn),
                 field("unicorn_bin", &HerderSection::unicorn_bin),
                 field("gunicorn_bin", &HerderSection::gunicorn_bin), field("pidfile", &HerderSection::pidfile),
                 field("args", &HerderSection::args), field("boot_timeout", &HerderSection::boot_timeout),
                 field("pidfile_timeout", &HerderSection::pidfile_timeout),
                 field("overlap", &HerderSection::overlap),
                 field("max_worker_wait_time", &HerderSection::max_worker_wait_time))

// Main configuration; every section is optional
struct Config {
    GeneralSection general;
    HerderSection herder;

    void validate() const
    {
        general.validate();
        herder.validate();
    }
};

template<> struct is_deserializable_struct<Config> : std::true_type { };

template<> Config deserialize<Config>(const ConfigNode &node);

// Parse and validate an INI configuration file
[[nodiscard]] Config loadConfig(const std::filesystem::path &config_file);

} // namespace cfg2
