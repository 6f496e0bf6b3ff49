#pragma once

#include "diyanet/caching_fetcher.h"
#include "diyanet/data_structures.h"
#include "diyanet/http_client.h"
#include "diyanet/persistent_cache.h"
#include <optional>
#include <string>
#include <vector>

namespace diyanet {

// Resolves country / state / region names to the site's identifiers and
// reads a region's prayer times. Name matching is case-insensitive.
class DiyanetClient {
public:
    DiyanetClient(const std::string& base_url, HttpClient& http, PersistentCache& cache);

    // Directory operations
    const std::vector<Country>& list_countries();
    std::vector<State> list_states(const Country& country);
    std::vector<Region> list_regions(const State& state);

    // Lookups, throw NotFoundError
    Country find_country(const std::string& name);
    State find_state(const Country& country, const std::string& name);
    Region find_region(const State& state, const std::string& name);

    PrayerTimes get_prayer_times(const Region& region);

    CachingFetcher& fetcher() { return fetcher_; }

private:
    // Drops a cached body that turned out to be unusable, so the next call refetches it
    void discard_page(const std::string& endpoint, const QueryParams& params = {});

    PersistentCache& cache_;
    CachingFetcher fetcher_;
    std::optional<std::vector<Country>> countries_;
};

} // namespace diyanet
