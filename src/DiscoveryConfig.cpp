// DiscoveryConfig.cpp
#include "DiscoveryConfig.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "Endpoint.hpp"

namespace Elixir {

namespace {

const char* env(const char* key) {
    const char* v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

bool envFlag(const char* key, bool fallback) {
    const char* v = env(key);
    if (!v) return fallback;
    std::string s(v);
    return s == "1" || s == "true" || s == "TRUE" || s == "yes";
}

long long envNumber(const char* key, long long fallback) {
    const char* v = env(key);
    if (!v) return fallback;
    try {
        return std::stoll(v);
    } catch (const std::exception&) {
        std::cerr << "[Config] Ignoring non-numeric " << key << "=" << v << std::endl;
        return fallback;
    }
}

// Network timeouts must stay positive: libcurl reads 0 as "wait forever".
std::chrono::milliseconds envTimeout(const char* key, std::chrono::milliseconds fallback) {
    long long ms = envNumber(key, fallback.count());
    if (ms <= 0) {
        std::cerr << "[Config] Ignoring non-positive " << key << "=" << ms << std::endl;
        return fallback;
    }
    return std::chrono::milliseconds(ms);
}

std::optional<std::string> envAddress(const char* key) {
    const char* v = env(key);
    if (!v) return std::nullopt;
    if (!Endpoint::parse(v)) {
        std::cerr << "[Config] Ignoring " << key << "=" << v << " (expected scheme://host[:port])" << std::endl;
        return std::nullopt;
    }
    return std::string(v);
}

} // anonymous namespace

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        std::string item = value.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
        size_t b = item.find_first_not_of(" \t");
        size_t e = item.find_last_not_of(" \t");
        if (b != std::string::npos) out.emplace_back(item.substr(b, e - b + 1));
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return out;
}

DiscoveryConfig DiscoveryConfig::fromEnvironment() {
    DiscoveryConfig config;
    config.applyEnvironment();
    return config;
}

void DiscoveryConfig::applyEnvironment() {
    defaultPort = static_cast<int>(envNumber("ELIXIR_DEFAULT_PORT", defaultPort));
    requestTimeout = envTimeout("ELIXIR_REQUEST_TIMEOUT_MS", requestTimeout);

    if (auto v = envAddress("ELIXIR_API_BASE_URL")) overrideApiAddress = v;
    if (auto v = envAddress("ELIXIR_WS_BASE_URL")) overrideStreamAddress = v;

    long long batch = envNumber("ELIXIR_DISCOVERY_BATCH_SIZE", static_cast<long long>(batchSize));
    if (batch > 0) batchSize = static_cast<std::size_t>(batch);

    // An explicitly empty prefix list is meaningful, so check presence rather than emptiness.
    if (const char* v = std::getenv("ELIXIR_NETWORK_PREFIXES")) networkPrefixes = splitList(v);
    hostRangeStart = static_cast<int>(envNumber("ELIXIR_HOST_RANGE_START", hostRangeStart));
    hostRangeEnd = static_cast<int>(envNumber("ELIXIR_HOST_RANGE_END", hostRangeEnd));
    quickScan = envFlag("ELIXIR_QUICK_SCAN", quickScan);
    if (const char* v = env("ELIXIR_QUICK_SCAN_HOSTS")) {
        std::vector<int> hosts;
        for (const auto& item : splitList(v)) {
            try {
                hosts.push_back(std::stoi(item));
            } catch (const std::exception&) {
                std::cerr << "[Config] Ignoring quick-scan host '" << item << "'" << std::endl;
            }
        }
        quickScanHosts = hosts;
    }

    if (const char* v = env("ELIXIR_HEALTH_PATH")) healthPath = v;
    if (const char* v = env("ELIXIR_IDENTITY_FIELD")) identityField = v;
    if (const char* v = env("ELIXIR_SERVICE_NAME")) expectedService = v;
    if (const char* v = env("ELIXIR_VERSION_FIELD")) versionField = v;
    if (const char* v = env("ELIXIR_SERVICE_VERSION")) expectedVersionPattern = v;
    if (const char* v = std::getenv("ELIXIR_REQUIRED_FIELDS")) requiredFields = splitList(v);
    if (const char* v = env("ELIXIR_VERIFY_PATHS")) additionalVerifyPaths = splitList(v);
    if (const char* v = env("ELIXIR_FALLBACK_URLS")) {
        std::vector<std::string> fallbacks;
        for (const auto& item : splitList(v)) {
            if (Endpoint::parse(item)) {
                fallbacks.push_back(item);
            } else {
                std::cerr << "[Config] Ignoring fallback '" << item << "' (expected scheme://host[:port])" << std::endl;
            }
        }
        fallbackAddresses = fallbacks;
    }

    cacheTtl = std::chrono::seconds(envNumber("ELIXIR_CACHE_TTL_SECONDS", cacheTtl.count()));

    localAddressTimeout = envTimeout("ELIXIR_LOCAL_ADDRESS_TIMEOUT_MS", localAddressTimeout);
    if (const char* v = env("ELIXIR_RENDEZVOUS")) {
        std::string s(v);
        size_t colon = s.rfind(':');
        if (colon == std::string::npos) {
            rendezvousHost = s;
        } else {
            rendezvousHost = s.substr(0, colon);
            try {
                rendezvousPort = std::stoi(s.substr(colon + 1));
            } catch (const std::exception&) {
                std::cerr << "[Config] Bad port in ELIXIR_RENDEZVOUS=" << s << std::endl;
            }
        }
    }

    connectionTimeout = envTimeout("ELIXIR_CONNECTION_TIMEOUT_MS", connectionTimeout);
    maxReconnectAttempts = static_cast<int>(envNumber("ELIXIR_WS_MAX_RECONNECT_ATTEMPTS", maxReconnectAttempts));
    reconnectInterval = std::chrono::milliseconds(envNumber("ELIXIR_WS_RECONNECT_INTERVAL_MS", reconnectInterval.count()));
    connectionCheckInterval = std::chrono::milliseconds(envNumber("ELIXIR_CONNECTION_CHECK_INTERVAL_MS", connectionCheckInterval.count()));

    verbose = envFlag("ELIXIR_DISCOVER_VERBOSE", verbose);
}

} // namespace Elixir
