#include "diyanet/curl_http_client.h"
#include "diyanet/errors.h"
#include "diyanet/logger.h"

#include <stdexcept>
#include <utility>

namespace diyanet {

namespace {

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensure_curl_global() {
    static CurlGlobal global;
}

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

CurlHttpClient::CurlHttpClient(HttpSettings settings)
    : settings_(std::move(settings)), handle_(nullptr, &curl_easy_cleanup) {
    ensure_curl_global();
    handle_.reset(curl_easy_init());
    if (!handle_) {
        throw std::runtime_error("Failed to initialize curl handle");
    }
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    CURL* curl = handle_.get();
    curl_easy_reset(curl);

    HttpResponse response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, settings_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, settings_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, settings_.timeout_secs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, settings_.timeout_secs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

    Logger::instance().debugf("GET %s", url.c_str());
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        std::string cause = error_buffer[0] ? std::string(error_buffer) : curl_easy_strerror(rc);
        throw FetchError(url, cause);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    Logger::instance().debugf("GET %s -> %ld (%zu bytes)", url.c_str(), response.status_code, response.body.size());
    return response;
}

} // namespace diyanet
