#pragma once

#include <map>
#include <string>

#include "diyanet/http_client.h"
#include "diyanet/persistent_cache.h"

namespace diyanet {

// Ordered by key so the canonical URL of a request never changes
using QueryParams = std::map<std::string, std::string>;

// GETs pages through the page section of the cache. A cached body is
// returned as-is forever; only misses reach the network.
class CachingFetcher {
public:
    CachingFetcher(std::string base_url, HttpClient& http, PersistentCache& cache);

    // base_url + endpoint [+ '?' + encoded params]. Absolute endpoints skip the base.
    std::string build_url(const std::string& endpoint, const QueryParams& params = {}) const;

    std::string fetch(const std::string& endpoint, const QueryParams& params = {});

    size_t network_requests() const { return network_requests_; }

private:
    std::string base_url_;
    HttpClient& http_;
    PersistentCache& cache_;
    size_t network_requests_;
};

} // namespace diyanet
