// VerificationClient.hpp
// Decides whether a candidate address is our control server, not just "something listening"
#pragma once

#include <optional>
#include <regex>
#include <string>

#include "DiscoveryConfig.hpp"

namespace Elixir {

class DiscoveryCache;
class HttpClient;

class VerificationClient {
public:
    // http and cache must outlive the client.
    VerificationClient(const DiscoveryConfig& config, HttpClient& http, DiscoveryCache& cache);

    // Pass/fail for one candidate base address. Consults the cache first and
    // records the outcome afterwards. Safe to call concurrently.
    bool verify(const std::string& candidate);

    // Grades a health-check body against the identity contract. No I/O.
    bool matchesIdentity(const std::string& body) const;

private:
    bool verifyUncached(const std::string& candidate);
    bool versionMatches(const std::string& version) const;

    DiscoveryConfig m_config;
    HttpClient& m_http;
    DiscoveryCache& m_cache;
    std::string m_expectedServiceLower;
    std::optional<std::regex> m_versionPattern;
    bool m_versionPatternInvalid{false};
};

} // namespace Elixir
