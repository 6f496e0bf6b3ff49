#include "diyanet/diyanet_client.h"
#include "diyanet/constants.h"
#include "diyanet/errors.h"
#include "diyanet/extractors.h"
#include "diyanet/json_helpers.h"
#include "diyanet/logger.h"
#include "diyanet/string_utils.h"
#include "diyanet/time_utils.h"

#include <algorithm>
#include <map>
#include <unordered_map>

namespace diyanet {

namespace {

struct PrayerLabel {
    const char* label;
    TimeOfDay PrayerTimes::*field;
};

// Labels used on the region page, in schedule order
const PrayerLabel PRAYER_LABELS[] = {
    {"İmsak",  &PrayerTimes::fajr},
    {"Güneş",  &PrayerTimes::sunrise},
    {"Öğle",   &PrayerTimes::dhuhr},
    {"İkindi", &PrayerTimes::asr},
    {"Akşam",  &PrayerTimes::maghrib},
    {"Yatsı",  &PrayerTimes::isha},
};

} // namespace

DiyanetClient::DiyanetClient(const std::string& base_url, HttpClient& http, PersistentCache& cache)
    : cache_(cache), fetcher_(base_url, http, cache) {}

void DiyanetClient::discard_page(const std::string& endpoint, const QueryParams& params) {
    const std::string url = fetcher_.build_url(endpoint, params);
    Logger::instance().debugf("Discarding unusable cached page %s", url.c_str());
    cache_.erase_page(url);
}

const std::vector<Country>& DiyanetClient::list_countries() {
    if (!countries_) {
        auto& logger = Logger::instance();
        if (cache_.has_countries()) {
            logger.debug("Using cached country directory");
        } else {
            logger.info("Fetching country directory");
            std::string page = fetcher_.fetch(HOME_ENDPOINT);
            std::vector<OptionEntry> options = extract_options(page, COUNTRY_SELECT_ID);
            if (options.empty()) {
                discard_page(HOME_ENDPOINT);
                logger.error("No country options found on the home page");
                throw ParseError("No country options found on the home page");
            }

            std::map<std::string, Country> directory;
            for (const auto& option : options) {
                directory[option.label] = Country(option.label, option.idx);
            }
            cache_.set_countries(std::move(directory));
            logger.debugf("Cached %zu countries", options.size());
        }
        countries_ = cache_.countries();
    }
    return countries_.value();
}

Country DiyanetClient::find_country(const std::string& name) {
    const std::vector<Country>& countries = list_countries();
    const std::string folded = casefold(name);
    auto it = std::find_if(countries.begin(), countries.end(),
                           [&](const Country& c) { return casefold(c.name) == folded; });
    if (it == countries.end()) throw NotFoundError(UnitKind::Country, name);
    return *it;
}

std::vector<State> DiyanetClient::list_states(const Country& country) {
    const QueryParams params = {
        {"ChangeType", "country"},
        {"CountryId", std::to_string(country.idx)},
    };
    std::string body = fetcher_.fetch(REGION_LIST_ENDPOINT, params);

    std::vector<State> states;
    if (!extract_state_list(body, country, states)) {
        discard_page(REGION_LIST_ENDPOINT, params);
        Logger::instance().errorf("Failed to extract state list for %s", country.name.c_str());
        throw ParseError("Failed to extract state list for country '" + country.name + "'");
    }
    return states;
}

State DiyanetClient::find_state(const Country& country, const std::string& name) {
    std::vector<State> states = list_states(country);
    const std::string folded = casefold(name);
    auto it = std::find_if(states.begin(), states.end(),
                           [&](const State& s) { return casefold(s.name) == folded; });
    if (it == states.end()) throw NotFoundError(UnitKind::State, name);
    return *it;
}

std::vector<Region> DiyanetClient::list_regions(const State& state) {
    const QueryParams params = {
        {"ChangeType", "state"},
        {"CountryId", std::to_string(state.country.idx)},
        {"StateId", std::to_string(state.idx)},
    };
    std::string body = fetcher_.fetch(REGION_LIST_ENDPOINT, params);

    std::vector<Region> regions;
    if (!extract_region_list(body, state, regions)) {
        discard_page(REGION_LIST_ENDPOINT, params);
        Logger::instance().errorf("Failed to extract region list for %s", state.name.c_str());
        throw ParseError("Failed to extract region list for state '" + state.name + "'");
    }
    return regions;
}

Region DiyanetClient::find_region(const State& state, const std::string& name) {
    std::vector<Region> regions = list_regions(state);
    const std::string folded = casefold(name);
    auto it = std::find_if(regions.begin(), regions.end(),
                           [&](const Region& r) { return casefold(r.name) == folded; });
    if (it == regions.end()) throw NotFoundError(UnitKind::Region, name);
    return *it;
}

PrayerTimes DiyanetClient::get_prayer_times(const Region& region) {
    std::string page = fetcher_.fetch(region.url);
    std::vector<TimeEntry> entries = extract_prayer_times(page);
    Logger::instance().debugf("Found %zu time entries for %s", entries.size(), region.name.c_str());

    std::unordered_map<std::string, std::string> by_label;
    for (const auto& entry : entries) {
        by_label[casefold(entry.label)] = entry.value;
    }

    PrayerTimes times;
    for (const auto& prayer : PRAYER_LABELS) {
        auto it = by_label.find(casefold(prayer.label));
        if (it == by_label.end()) {
            discard_page(region.url);
            throw ParseError(std::string("Incomplete schedule for '") + region.name +
                             "': missing '" + prayer.label + "'");
        }
        try {
            times.*(prayer.field) = parse_time_of_day(it->second);
        } catch (const TimeFormatError&) {
            discard_page(region.url);
            throw;
        }
    }
    return times;
}

} // namespace diyanet
