#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "diyanet/cli.h"
#include "diyanet/config.h"
#include "diyanet/curl_http_client.h"
#include "diyanet/logger.h"

using namespace diyanet;

int main(int argc, char* argv[]) {
    Logger::initialize();

    std::vector<std::string> args(argv + 1, argv + argc);
    Config defaults = load_config_from_env();

    auto make_http = [](const Config& config) -> std::unique_ptr<HttpClient> {
        return std::make_unique<CurlHttpClient>(HttpSettings{config.timeout_secs, config.user_agent, true});
    };

    return run_cli(args, defaults, make_http, std::cout, std::cerr);
}
