#pragma once

#include <string>

namespace diyanet {

//! Struct to hold HTTP response
struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Blocking HTTP transport
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Throws FetchError when no response could be obtained.
    virtual HttpResponse get(const std::string& url) = 0;
};

} // namespace diyanet
