#pragma once

#include <string>

struct HttpResponse {
    long status = 0;     // 0 when the transfer itself failed
    std::string body;
    std::string error;   // curl error text for transport failures
};

// Performs a blocking GET. HTTP error statuses are returned, not thrown.
HttpResponse http_get(const std::string& url, const std::string& accept = "");

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};
