// HttpClient.hpp
// Bounded-timeout HTTP GET used for health checks and connection tests
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace Elixir {

struct HttpResponse {
    long status{0};
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // nullopt on any transport failure or timeout. Must be safe to call from
    // several threads at once.
    virtual std::optional<HttpResponse> get(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

// libcurl-backed client. One easy handle per request, so concurrent gets are fine.
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    std::optional<HttpResponse> get(const std::string& url, std::chrono::milliseconds timeout) override;
};

} // namespace Elixir
