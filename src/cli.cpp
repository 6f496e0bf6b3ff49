#include "diyanet/cli.h"
#include "diyanet/diyanet_client.h"
#include "diyanet/logger.h"
#include "diyanet/persistent_cache.h"

#include <cerrno>
#include <cstdlib>
#include <ostream>

namespace diyanet {

namespace {

bool parse_timeout(const std::string& text, long& out) {
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || errno != 0 || *end != '\0' || value < 0) return false;
    out = value;
    return true;
}

template <typename Unit>
void print_names(const std::vector<Unit>& units, std::ostream& out) {
    for (const auto& unit : units) {
        out << unit.name << '\n';
    }
}

} // namespace

void print_usage(std::ostream& out) {
    out << "Usage: diyanet-times [options] [country [state [region]]]\n"
        << "\n"
        << "  With all three names, prints the prayer times of the region.\n"
        << "  With fewer, lists the names one level below the last one given.\n"
        << "\n"
        << "Options:\n"
        << "  -c, --cache-dir DIR   cache directory\n"
        << "  -t, --timeout SECS    HTTP timeout in seconds, 0 waits forever\n"
        << "  -b, --base-url URL    site base URL\n"
        << "  -v                    more logging (repeatable)\n"
        << "  -h, --help            show this help\n";
}

void print_prayer_times(const PrayerTimes& times, std::ostream& out) {
    out << "Fajr ===> " << times.fajr.to_string() << '\n'
        << "Sunrise ===> " << times.sunrise.to_string() << '\n'
        << "Dhuhr ===> " << times.dhuhr.to_string() << '\n'
        << "Asr ===> " << times.asr.to_string() << '\n'
        << "Maghrib ===> " << times.maghrib.to_string() << '\n'
        << "Isha ===> " << times.isha.to_string() << '\n';
}

bool parse_cli_arguments(const std::vector<std::string>& args, CliOptions& options) {
    auto& logger = Logger::instance();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        const bool takes_value = arg == "-c" || arg == "--cache-dir" || arg == "-t" ||
                                 arg == "--timeout" || arg == "-b" || arg == "--base-url";
        if (takes_value && i + 1 >= args.size()) {
            logger.errorf("Option %s requires a value", arg.c_str());
            return false;
        }

        if (arg == "-h" || arg == "--help") {
            options.show_help = true;
        } else if (arg == "-c" || arg == "--cache-dir") {
            options.config.cache_dir = args[++i];
        } else if (arg == "-t" || arg == "--timeout") {
            const std::string& value = args[++i];
            if (!parse_timeout(value, options.config.timeout_secs)) {
                logger.errorf("Invalid timeout: %s", value.c_str());
                return false;
            }
        } else if (arg == "-b" || arg == "--base-url") {
            options.config.base_url = args[++i];
        } else if (arg == "-v" || arg == "-vv") {
            options.verbosity += static_cast<int>(arg.size()) - 1;
        } else if (arg.size() > 1 && arg[0] == '-') {
            logger.errorf("Unknown option: %s", arg.c_str());
            return false;
        } else {
            options.names.push_back(arg);
        }
    }

    if (options.names.size() > 3) {
        logger.error("At most three names are accepted: country, state, region");
        return false;
    }

    if (options.verbosity >= 2) {
        options.config.log_level = LogLevel::Debug;
    } else if (options.verbosity == 1 && options.config.log_level > LogLevel::Info) {
        options.config.log_level = LogLevel::Info;
    }
    return true;
}

int run_cli(const std::vector<std::string>& args, const Config& defaults,
            const HttpClientFactory& make_http, std::ostream& out, std::ostream& err) {
    auto& logger = Logger::instance();

    CliOptions options;
    options.config = defaults;
    if (!parse_cli_arguments(args, options)) {
        print_usage(err);
        return CLI_EXIT_USAGE;
    }
    if (options.show_help) {
        print_usage(err);
        return CLI_EXIT_OK;
    }

    Config& config = options.config;
    const std::vector<std::string>& names = options.names;
    logger.set_level(config.log_level);

    try {
        if (config.cache_dir.empty()) {
            config.cache_dir = resolve_cache_dir();
        } else {
            ensure_cache_dir(config.cache_dir);
        }
        logger.infof("Using cache directory %s", config.cache_dir.c_str());

        PersistentCache cache(cache_file_path(config.cache_dir));
        std::unique_ptr<HttpClient> http = make_http(config);
        DiyanetClient client(config.base_url, *http, cache);

        if (names.empty()) {
            print_names(client.list_countries(), out);
        } else {
            Country country = client.find_country(names[0]);
            if (names.size() == 1) {
                print_names(client.list_states(country), out);
            } else {
                State state = client.find_state(country, names[1]);
                if (names.size() == 2) {
                    print_names(client.list_regions(state), out);
                } else {
                    Region region = client.find_region(state, names[2]);
                    logger.infof("Resolved region: %s", region.to_string().c_str());
                    print_prayer_times(client.get_prayer_times(region), out);
                }
            }
        }

        cache.flush();
    }
    catch (const std::exception& e) {
        logger.errorf("Error: %s", e.what());
        return CLI_EXIT_ERROR;
    }

    return CLI_EXIT_OK;
}

} // namespace diyanet
