#include "diyanet/config.h"
#include "diyanet/errors.h"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace diyanet {

namespace {

const char* non_empty_env(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0]) ? value : nullptr;
}

} // namespace

Config load_config_from_env() {
    Config config;
    auto& logger = Logger::instance();

    if (const char* base_url = non_empty_env(ENV_BASE_URL)) {
        config.base_url = base_url;
    }

    if (const char* timeout = non_empty_env(ENV_TIMEOUT)) {
        errno = 0;
        char* end = nullptr;
        long value = std::strtol(timeout, &end, 10);
        if (errno != 0 || *end != '\0' || value < 0) {
            logger.warningf("Ignoring invalid %s='%s'", ENV_TIMEOUT, timeout);
        } else {
            config.timeout_secs = value;
        }
    }

    if (const char* level = non_empty_env(ENV_LOG_LEVEL)) {
        if (!parse_log_level(level, config.log_level)) {
            logger.warningf("Ignoring invalid %s='%s'", ENV_LOG_LEVEL, level);
        }
    }

    return config;
}

std::string resolve_cache_dir() {
    fs::path base;
    if (const char* dir = non_empty_env(ENV_CACHE_HOME)) {
        base = dir;
    } else if (const char* xdg = non_empty_env(ENV_XDG_CACHE_HOME)) {
        base = xdg;
    } else if (const char* home = non_empty_env("HOME")) {
        base = fs::path(home) / ".cache";
    } else {
        throw CacheDirError(std::string("No cache directory: set ") + ENV_CACHE_HOME + " or " +
                            ENV_XDG_CACHE_HOME + ", or make ~/.cache available");
    }

    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        throw CacheDirError("Cache base directory '" + base.string() + "' does not exist; set " +
                            ENV_CACHE_HOME + " or " + ENV_XDG_CACHE_HOME + " to a valid path");
    }

    std::string dir = (base / CACHE_SUBDIR).string();
    ensure_cache_dir(dir);
    return dir;
}

void ensure_cache_dir(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir, ec)) {
        throw CacheDirError("Cannot use cache directory '" + dir + "'" +
                            (ec ? ": " + ec.message() : std::string()));
    }
}

std::string cache_file_path(const std::string& cache_dir) {
    return (fs::path(cache_dir) / CACHE_FILE_NAME).string();
}

} // namespace diyanet
