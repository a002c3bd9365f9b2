#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <curl/curl.h>

#include <memory>

namespace {

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    size_t bytes = size * nmemb;
    out->append(static_cast<const char*>(ptr), bytes);
    return bytes;
}

// Custom deleters for the curl handles
struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

}

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}

HttpResponse http_get(const std::string& url, const std::string& accept) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw HotpackException(string_format("error.download_failed", url));
    }

    HttpResponse response;
    CurlHeaders headers;
    if (!accept.empty()) {
        headers.reset(curl_slist_append(nullptr, ("Accept: " + accept).c_str()));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // Called from worker threads
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "hotpack/" HOTPACK_VERSION);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.status = 0;
        response.error = curl_easy_strerror(res);
        return response;
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
