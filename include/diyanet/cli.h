#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "diyanet/config.h"
#include "diyanet/data_structures.h"
#include "diyanet/http_client.h"

namespace diyanet {

constexpr int CLI_EXIT_OK = 0;
constexpr int CLI_EXIT_ERROR = 1;
constexpr int CLI_EXIT_USAGE = 2;

struct CliOptions {
    Config config;
    std::vector<std::string> names; // country [state [region]]
    int verbosity = 0;
    bool show_help = false;
};

// Parses the arguments that follow the program name on top of options.config.
// Returns false after logging the problem when the command line is unusable.
bool parse_cli_arguments(const std::vector<std::string>& args, CliOptions& options);

void print_usage(std::ostream& out);

void print_prayer_times(const PrayerTimes& times, std::ostream& out);

using HttpClientFactory = std::function<std::unique_ptr<HttpClient>(const Config&)>;

// diyanet-times: lists the directory below the deepest name given, or prints the
// prayer times of a fully named region. Results go to out, usage text to err.
// Returns the process exit status.
int run_cli(const std::vector<std::string>& args, const Config& defaults,
            const HttpClientFactory& make_http, std::ostream& out, std::ostream& err);

} // namespace diyanet
