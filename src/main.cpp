#include "cfg2/config.hpp"
#include "logger/spdlog_init.hpp"
#include "supervisor/herder_exception.hpp"
#include "supervisor/monitor.hpp"
#include "supervisor/pid_registry.hpp"
#include "supervisor/process_table.hpp"
#include "supervisor/settings.hpp"
#include "utils/string.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

using namespace std;
using namespace herder;

static void print_help()
{
    cout << "\nherder - zero-downtime reloads for unicorn and gunicorn\n\n"
            "Usage: herder [options] [-- server arguments]\n\n"
            "Options:\n"
            "  -h, --help                     This message\n"
            "  -c, --config FILE              Path to configuration file\n"
            "  -u, --unicorn TYPE             unicorn, unicorn_rails, gunicorn or gunicorn_django (default: gunicorn)\n"
            "      --unicorn-bin PATH         Run a specific unicorn binary\n"
            "      --gunicorn-bin PATH        Run a specific gunicorn binary\n"
            "  -p, --pidfile PATH             Pidfile written by the server (default: <TYPE>.pid)\n"
            "  -t, --timeout SECONDS          Time allowed for the server to daemonize (default: 180)\n"
            "      --pidfile-timeout SECONDS  Time allowed for the pidfile to become readable (default: 180)\n"
            "  -o, --overlap SECONDS          Time both masters serve during a reload (default: 180)\n"
            "      --max-worker-wait SECONDS  Time allowed for the new workers to come up (default: 180)\n"
            "  -l, --loglevel LEVEL           trace, debug, info, warning, error or critical\n"
            "\nHUP triggers a graceful reload; INT, QUIT, TERM, TTIN, TTOU, USR1 and USR2\n"
            "are forwarded to the server's master process.\n"
         << endl;
}


namespace {

enum long_only_options { opt_unicorn_bin = 256, opt_gunicorn_bin, opt_pidfile_timeout, opt_max_worker_wait };

// command-line values; each one set overrides the configuration file
struct overrides {
    optional<string> unicorn;
    optional<string> unicorn_bin;
    optional<string> gunicorn_bin;
    optional<string> pidfile;
    optional<int> boot_timeout;
    optional<int> pidfile_timeout;
    optional<int> overlap;
    optional<int> max_worker_wait_time;
    optional<string> log_priority;
    vector<string> args;
};


int seconds_arg(const char *option, const char *value)
{
    try {
        return cfg2::fromString<int>(value);
    } catch (const invalid_argument &) {
        throw invalid_argument(string("Option ") + option + " expects a number of seconds, got '" + value + "'");
    }
}


void apply(const overrides &o, cfg2::Config &config)
{
    auto &h = config.herder;
    if (o.unicorn)
        h.unicorn = *o.unicorn;
    if (o.unicorn_bin)
        h.unicorn_bin = *o.unicorn_bin;
    if (o.gunicorn_bin)
        h.gunicorn_bin = *o.gunicorn_bin;
    if (o.pidfile)
        h.pidfile = *o.pidfile;
    if (o.boot_timeout)
        h.boot_timeout = *o.boot_timeout;
    if (o.pidfile_timeout)
        h.pidfile_timeout = *o.pidfile_timeout;
    if (o.overlap)
        h.overlap = *o.overlap;
    if (o.max_worker_wait_time)
        h.max_worker_wait_time = *o.max_worker_wait_time;
    if (o.log_priority)
        config.general.log_priority = *o.log_priority;
}

} // namespace


int main(int argc, char *argv[])
{
    static const option long_options[] = {
        {"help", no_argument, nullptr, 'h'},
        {"config", required_argument, nullptr, 'c'},
        {"unicorn", required_argument, nullptr, 'u'},
        {"unicorn-bin", required_argument, nullptr, opt_unicorn_bin},
        {"gunicorn-bin", required_argument, nullptr, opt_gunicorn_bin},
        {"pidfile", required_argument, nullptr, 'p'},
        {"timeout", required_argument, nullptr, 't'},
        {"pidfile-timeout", required_argument, nullptr, opt_pidfile_timeout},
        {"overlap", required_argument, nullptr, 'o'},
        {"max-worker-wait", required_argument, nullptr, opt_max_worker_wait},
        {"loglevel", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0},
    };

    int ch = 0;
    const char *config_file = nullptr;
    overrides cli;

    try {
        while ((ch = getopt_long(argc, argv, "hc:u:p:t:o:l:", long_options, nullptr)) != -1) {
            switch (ch) {
            case 'c':
                config_file = optarg;
                break;
            case 'u':
                cli.unicorn = optarg;
                break;
            case opt_unicorn_bin:
                cli.unicorn_bin = optarg;
                break;
            case opt_gunicorn_bin:
                cli.gunicorn_bin = optarg;
                break;
            case 'p':
                cli.pidfile = optarg;
                break;
            case 't':
                cli.boot_timeout = seconds_arg("--timeout", optarg);
                break;
            case opt_pidfile_timeout:
                cli.pidfile_timeout = seconds_arg("--pidfile-timeout", optarg);
                break;
            case 'o':
                cli.overlap = seconds_arg("--overlap", optarg);
                break;
            case opt_max_worker_wait:
                cli.max_worker_wait_time = seconds_arg("--max-worker-wait", optarg);
                break;
            case 'l':
                cli.log_priority = utils::string::to_lower(optarg);
                break;
            case 'h':
            case '?':
            default:
                print_help();
                return EXIT_FAILURE;
            }
        }
    } catch (const invalid_argument &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    for (int i = optind; i < argc; ++i)
        cli.args.emplace_back(argv[i]);

    try {
        cfg2::Config config = config_file ? cfg2::loadConfig(config_file) : cfg2::Config{};
        apply(as_const(cli), config);
        config.validate();
        logging::init_spdlog(config.general);

        settings s = settings::from_config(config.herder);
        // already split by the shell
        if (!cli.args.empty())
            s.args = cli.args;

        // static: the emergency reaper runs from exit handlers after main returns
        static pid_registry registry;
        install_emergency_reaper(registry);

        proc_process_table processes;
        monitor supervisor(std::move(s), registry, processes);

        if (!supervisor.spawn())
            return EXIT_FAILURE;

        return supervisor.loop();
    } catch (const invalid_argument &e) {
        spdlog::error("Configuration error: {}", e.what());
    } catch (const herder_exception &e) {
        spdlog::error("{}", e.what());
    } catch (const boost::exception &e) {
        spdlog::error("Boost exception caught: {}", boost::diagnostic_information(e));
    } catch (const exception &e) {
        spdlog::error("Exception caught: {}", e.what());
    } catch (...) {
        spdlog::error("Unknown exception caught");
    }

    return EXIT_FAILURE;
}
