#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

#include "diyanet/http_client.h"

namespace diyanet {

//! Struct to hold HTTP settings
struct HttpSettings {
    long timeout_secs;      // 0 waits forever
    std::string user_agent;
    bool follow_redirects;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpSettings settings);

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url) override;

private:
    HttpSettings settings_;
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle_;
};

} // namespace diyanet
