#pragma once

#include <string>

#include "diyanet/constants.h"
#include "diyanet/logger.h"

namespace diyanet {

struct Config {
    std::string base_url = DEFAULT_BASE_URL;
    long timeout_secs = DEFAULT_TIMEOUT_SECS;
    std::string user_agent = DEFAULT_USER_AGENT;
    std::string cache_dir;   // empty: resolved from the environment
    LogLevel log_level = LogLevel::Warning;
};

// Defaults overridden by DIYANET_BASE_URL, DIYANET_TIMEOUT and DIYANET_LOG_LEVEL.
// Malformed values are reported and ignored.
Config load_config_from_env();

// <first of $DIYANET_CACHE_HOME, $XDG_CACHE_HOME, $HOME/.cache>/diyanet, created
// if needed. The base directory itself must already exist. Throws CacheDirError.
std::string resolve_cache_dir();

// Creates dir when missing; throws CacheDirError if it is not a usable directory.
void ensure_cache_dir(const std::string& dir);

std::string cache_file_path(const std::string& cache_dir);

} // namespace diyanet
