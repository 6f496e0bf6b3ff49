#include "diyanet/caching_fetcher.h"
#include "diyanet/errors.h"
#include "diyanet/logger.h"
#include "diyanet/string_utils.h"

namespace diyanet {

namespace {

bool is_absolute_url(const std::string& s) {
    return s.compare(0, 7, "http://") == 0 || s.compare(0, 8, "https://") == 0;
}

} // namespace

CachingFetcher::CachingFetcher(std::string base_url, HttpClient& http, PersistentCache& cache)
    : base_url_(std::move(base_url)), http_(http), cache_(cache), network_requests_(0) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string CachingFetcher::build_url(const std::string& endpoint, const QueryParams& params) const {
    std::string url;
    if (is_absolute_url(endpoint)) {
        url = endpoint;
    } else {
        url = base_url_;
        if (!endpoint.empty() && endpoint.front() != '/') {
            url += '/';
        }
        url += endpoint;
    }

    char separator = '?';
    for (const auto& param : params) {
        url += separator;
        url += url_encode(param.first);
        url += '=';
        url += url_encode(param.second);
        separator = '&';
    }
    return url;
}

std::string CachingFetcher::fetch(const std::string& endpoint, const QueryParams& params) {
    auto& logger = Logger::instance();
    const std::string url = build_url(endpoint, params);

    if (auto cached = cache_.get_page(url)) {
        logger.debugf("Cache hit: %s", url.c_str());
        return *cached;
    }

    logger.debugf("Cache miss: %s", url.c_str());
    ++network_requests_;
    HttpResponse response = http_.get(url);

    if (response.status_code >= 400) {
        throw FetchError(url, "HTTP status " + std::to_string(response.status_code));
    }
    if (!is_valid_utf8(response.body)) {
        throw FetchError(url, "response body is not valid UTF-8 text");
    }

    cache_.put_page(url, response.body);
    return response.body;
}

} // namespace diyanet
