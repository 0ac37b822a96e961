// DiscoveryConfig.hpp
// Tunables for backend endpoint discovery, overridable through ELIXIR_* env vars
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace Elixir {

struct DiscoveryConfig {
    int defaultPort{8000};
    std::chrono::milliseconds requestTimeout{2000};

    // Operator override pair. The stream address is optional; it is derived
    // from the API address when absent.
    std::optional<std::string> overrideApiAddress;
    std::optional<std::string> overrideStreamAddress;

    std::size_t batchSize{20};

    std::vector<std::string> networkPrefixes{"192.168.1", "192.168.0", "10.0.0", "172.16.0"};
    int hostRangeStart{1};
    int hostRangeEnd{254};
    bool quickScan{false};
    std::vector<int> quickScanHosts{1, 2, 10, 100, 254};

    // Health-check identity contract
    std::string healthPath{"/health"};
    std::string identityField{"service"};
    std::string expectedService{"elixir"};
    std::string versionField{"version"};
    std::string expectedVersionPattern;          // ECMAScript regex, empty = any
    std::vector<std::string> requiredFields{"status"};
    std::vector<std::string> additionalVerifyPaths;

    std::vector<std::string> fallbackAddresses{"http://raspberrypi.local:8000", "http://elixir.local:8000"};

    std::chrono::seconds cacheTtl{300};

    std::chrono::milliseconds localAddressTimeout{3000};
    std::string rendezvousHost{"stun.l.google.com"};
    int rendezvousPort{19302};

    // Connection monitoring
    std::chrono::milliseconds connectionTimeout{5000};
    int maxReconnectAttempts{5};
    std::chrono::milliseconds reconnectInterval{1000};
    std::chrono::milliseconds connectionCheckInterval{10000};

    bool verbose{false};

    // Defaults overlaid with whatever ELIXIR_* variables are set.
    static DiscoveryConfig fromEnvironment();

    // Apply ELIXIR_* variables on top of this config.
    void applyEnvironment();
};

// "a, b,,c" -> {"a","b","c"}
std::vector<std::string> splitList(const std::string& value);

} // namespace Elixir
