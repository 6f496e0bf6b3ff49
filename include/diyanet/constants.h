#pragma once

namespace diyanet {

constexpr const char* DEFAULT_BASE_URL   = "https://namazvakitleri.diyanet.gov.tr";
constexpr const char* HOME_ENDPOINT      = "/tr-TR/home";
constexpr const char* REGION_LIST_ENDPOINT = "/tr-TR/home/GetRegList";
constexpr const char* COUNTRY_SELECT_ID  = "country-select";

constexpr const char* DEFAULT_USER_AGENT = "diyanet-times/1.0";
constexpr long DEFAULT_TIMEOUT_SECS      = 30;

// Cache directory lookup order, then $HOME/.cache
constexpr const char* ENV_CACHE_HOME     = "DIYANET_CACHE_HOME";
constexpr const char* ENV_XDG_CACHE_HOME = "XDG_CACHE_HOME";
constexpr const char* CACHE_SUBDIR       = "diyanet";
constexpr const char* CACHE_FILE_NAME    = "db";

constexpr const char* ENV_BASE_URL       = "DIYANET_BASE_URL";
constexpr const char* ENV_TIMEOUT        = "DIYANET_TIMEOUT";
constexpr const char* ENV_LOG_LEVEL      = "DIYANET_LOG_LEVEL";

constexpr int CACHE_FORMAT_VERSION = 1;

} // namespace diyanet
