// BackendConnection.cpp
#include "BackendConnection.hpp"

#include <iostream>

#include "DiscoveryCoordinator.hpp"
#include "Endpoint.hpp"
#include "HttpClient.hpp"

namespace Elixir {

BackendConnection::BackendConnection(const DiscoveryConfig& config, DiscoveryCoordinator& coordinator, HttpClient& http)
    : m_config(config), m_coordinator(coordinator), m_http(http) {}

bool BackendConnection::testConnection() {
    auto result = m_coordinator.discover();
    auto response = m_http.get(joinUrl(result.apiAddress, m_config.healthPath), m_config.connectionTimeout);
    return response && response->ok();
}

ConnectionState BackendConnection::refresh() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state.discovering = true;
        m_state.error.clear();
    }

    auto result = m_coordinator.discover();
    auto response = m_http.get(joinUrl(result.apiAddress, m_config.healthPath), m_config.connectionTimeout);
    bool connected = response && response->ok();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_state.connected = connected;
    m_state.discovering = false;
    m_state.apiUrl = result.apiAddress;
    m_state.streamUrl = result.streamAddress;
    m_state.verified = result.verified;
    m_state.lastDiscovery = std::chrono::system_clock::now();
    if (!connected) {
        m_state.error = response ? "health check returned HTTP " + std::to_string(response->status)
                                 : "backend unreachable";
    }
    std::cout << "[Connection] " << (connected ? "Connected to " : "Not reachable: ") << result.apiAddress
              << " (stream " << result.streamAddress << ")" << std::endl;
    return m_state;
}

ConnectionState BackendConnection::resetAndDiscover() {
    std::cout << "[Connection] Resetting discovery and reconnecting..." << std::endl;
    m_coordinator.reset();
    return refresh();
}

std::string BackendConnection::apiUrl(const std::string& path) {
    return joinUrl(m_coordinator.discover().apiAddress, path);
}

std::string BackendConnection::streamUrl(const std::string& path) {
    return joinUrl(m_coordinator.discover().streamAddress, path);
}

bool BackendConnection::onStreamClosed() {
    int attempt = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state.connected = false;
        if (m_reconnectAttempts >= m_config.maxReconnectAttempts) {
            std::cerr << "[Connection] Max reconnection attempts reached (" << m_reconnectAttempts << ")" << std::endl;
            return false;
        }
        attempt = ++m_reconnectAttempts;
    }
    std::cout << "[Connection] Reconnect attempt " << attempt << "/" << m_config.maxReconnectAttempts << std::endl;
    if (attempt % 3 == 0) {
        std::cout << "[Connection] Retrying backend discovery..." << std::endl;
        m_coordinator.reset();
    }
    return true;
}

void BackendConnection::onStreamOpened() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_reconnectAttempts = 0;
    m_state.connected = true;
}

int BackendConnection::reconnectAttempts() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reconnectAttempts;
}

ConnectionState BackendConnection::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

} // namespace Elixir
