// HttpClient.cpp
#include "HttpClient.hpp"

#include <curl/curl.h>

#include <iostream>

namespace Elixir {

namespace {

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

} // anonymous namespace

CurlHttpClient::CurlHttpClient() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpClient::~CurlHttpClient() {
    curl_global_cleanup();
}

std::optional<HttpResponse> CurlHttpClient::get(const std::string& url, std::chrono::milliseconds timeout) {
    // libcurl treats 0 as "no timeout"; every request must be bounded.
    if (timeout.count() <= 0) {
        std::cerr << "[Http] Refusing unbounded request to " << url << " (timeout " << timeout.count() << " ms)" << std::endl;
        return std::nullopt;
    }

    CURL* curl = curl_easy_init();
    if (!curl) return std::nullopt;

    HttpResponse response;
    long timeoutMs = static_cast<long>(timeout.count());
    struct curl_slist* headers = curl_slist_append(nullptr, "Accept: application/json");

    CURLcode rc = CURLE_OK;
    auto setopt = [&](CURLoption option, auto value) {
        if (rc == CURLE_OK) rc = curl_easy_setopt(curl, option, value);
    };
    setopt(CURLOPT_URL, url.c_str());
    setopt(CURLOPT_WRITEFUNCTION, writeCallback);
    setopt(CURLOPT_WRITEDATA, &response.body);
    setopt(CURLOPT_TIMEOUT_MS, timeoutMs);
    setopt(CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    // Timeouts must not rely on SIGALRM when probes run on worker threads.
    setopt(CURLOPT_NOSIGNAL, 1L);
    setopt(CURLOPT_FOLLOWLOCATION, 0L);
    setopt(CURLOPT_USERAGENT, "ElixirLink/1.0");
    setopt(CURLOPT_HTTPHEADER, headers);

    if (rc != CURLE_OK) {
        std::cerr << "[Http] Cannot configure request to " << url << ": " << curl_easy_strerror(rc) << std::endl;
    } else {
        rc = curl_easy_perform(curl);
        if (rc == CURLE_OK) rc = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) return std::nullopt;
    return response;
}

} // namespace Elixir
