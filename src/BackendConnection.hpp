// BackendConnection.hpp
// Application-facing view of the backend: resolved URLs, reachability and
// the stream reconnect policy.
#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include "DiscoveryConfig.hpp"

namespace Elixir {

class DiscoveryCoordinator;
class HttpClient;

struct ConnectionState {
    bool connected{false};
    bool discovering{false};
    std::string apiUrl;
    std::string streamUrl;
    bool verified{false};
    std::string error;
    std::optional<std::chrono::system_clock::time_point> lastDiscovery;
};

class BackendConnection {
public:
    BackendConnection(const DiscoveryConfig& config, DiscoveryCoordinator& coordinator, HttpClient& http);

    // GET <api><healthPath> within the connection timeout; true on 2xx.
    bool testConnection();

    // Discover (reusing any resolved endpoint) then test reachability.
    ConnectionState refresh();
    ConnectionState reconnect() { return refresh(); }

    // Manual retry: forget the endpoint and cached verifications, then refresh.
    ConnectionState resetAndDiscover();

    // Full URLs on the resolved endpoint; discovers on first use.
    std::string apiUrl(const std::string& path);
    std::string streamUrl(const std::string& path);

    // Stream dropped. Returns false once the attempt budget is spent. Every
    // third attempt resets discovery so the reconnect rescans the network.
    bool onStreamClosed();
    void onStreamOpened();
    int reconnectAttempts() const;

    ConnectionState state() const;

private:
    DiscoveryConfig m_config;
    DiscoveryCoordinator& m_coordinator;
    HttpClient& m_http;

    mutable std::mutex m_mutex;
    ConnectionState m_state;
    int m_reconnectAttempts{0};
};

} // namespace Elixir
