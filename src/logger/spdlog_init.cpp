#include "logger/spdlog_init.hpp"

#include "cfg2/config.hpp"
#include <map>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <syslog.h>

namespace herder::logging {
namespace {

constexpr char SYSLOG_LOGGER_NAME[] = "herder_syslog";
constexpr char CONSOLE_LOGGER_NAME[] = "herder_console";
constexpr char SYSLOG_IDENT[] = "herder";

// the server's own output shares the terminal, so every line names its origin
constexpr char CONSOLE_PATTERN[] = "[%Y-%m-%d %H:%M:%S.%e] [herder:%P] [%^%l%$] %v";


spdlog::level::level_enum level_from(const std::string &priority)
{
    static const std::map<std::string, spdlog::level::level_enum> levels = {
        {"trace", spdlog::level::trace},  {"debug", spdlog::level::debug}, {"info", spdlog::level::info},
        {"warning", spdlog::level::warn}, {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
    };

    auto it = levels.find(priority);
    if (it == levels.end())
        throw std::invalid_argument("Invalid log_priority: " + priority);
    return it->second;
}


int facility_from(const std::string &facility)
{
    static const std::map<std::string, int> facilities = {
        {"user", LOG_USER},     {"daemon", LOG_DAEMON}, {"local0", LOG_LOCAL0}, {"local1", LOG_LOCAL1},
        {"local2", LOG_LOCAL2}, {"local3", LOG_LOCAL3}, {"local4", LOG_LOCAL4}, {"local5", LOG_LOCAL5},
        {"local6", LOG_LOCAL6}, {"local7", LOG_LOCAL7},
    };

    auto it = facilities.find(facility);
    if (it == facilities.end())
        throw std::invalid_argument("Invalid log_facility: " + facility);
    return it->second;
}


std::shared_ptr<spdlog::logger> syslog_logger(int facility)
{
    spdlog::drop(CONSOLE_LOGGER_NAME);
    spdlog::drop(SYSLOG_LOGGER_NAME);
    return spdlog::syslog_logger_mt(SYSLOG_LOGGER_NAME, SYSLOG_IDENT, LOG_PID, facility);
}


std::shared_ptr<spdlog::logger> console_logger()
{
    spdlog::drop(SYSLOG_LOGGER_NAME);
    auto logger = spdlog::get(CONSOLE_LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stdout_color_mt(CONSOLE_LOGGER_NAME);
        logger->set_pattern(CONSOLE_PATTERN);
    }
    return logger;
}

} // namespace


void init_spdlog(const cfg2::GeneralSection &general_section)
{
    // a bad value leaves the current logger in place
    const auto level = level_from(general_section.log_priority);

    std::shared_ptr<spdlog::logger> logger;
    if (general_section.log_type == "syslog")
        logger = syslog_logger(facility_from(general_section.log_facility));
    else
        logger = console_logger();

    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
}

} // namespace herder::logging
