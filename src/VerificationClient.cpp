// VerificationClient.cpp
#include "VerificationClient.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "DiscoveryCache.hpp"
#include "Endpoint.hpp"
#include "HttpClient.hpp"
#include "JsonFields.hpp"

namespace Elixir {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

VerificationClient::VerificationClient(const DiscoveryConfig& config, HttpClient& http, DiscoveryCache& cache)
    : m_config(config), m_http(http), m_cache(cache), m_expectedServiceLower(lower(config.expectedService)) {
    if (!m_config.expectedVersionPattern.empty()) {
        try {
            m_versionPattern.emplace(m_config.expectedVersionPattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            // Fail closed: a pattern we cannot evaluate never matches.
            std::cerr << "[Verify] Invalid version pattern '" << m_config.expectedVersionPattern
                      << "': " << e.what() << std::endl;
            m_versionPatternInvalid = true;
        }
    }
}

bool VerificationClient::verify(const std::string& candidate) {
    if (auto cached = m_cache.getFresh(candidate)) {
        if (m_config.verbose) {
            std::cout << "[Verify] " << candidate << " cached as " << (cached->valid ? "valid" : "invalid") << std::endl;
        }
        return cached->valid;
    }

    bool valid = verifyUncached(candidate);
    m_cache.set(candidate, valid);
    if (m_config.verbose) {
        std::cout << "[Verify] " << candidate << (valid ? " -> verified" : " -> rejected") << std::endl;
    }
    return valid;
}

bool VerificationClient::verifyUncached(const std::string& candidate) {
    auto health = m_http.get(joinUrl(candidate, m_config.healthPath), m_config.requestTimeout);
    if (!health || !health->ok()) return false;
    if (!matchesIdentity(health->body)) return false;

    for (const auto& path : m_config.additionalVerifyPaths) {
        auto extra = m_http.get(joinUrl(candidate, path), m_config.requestTimeout);
        if (!extra || !extra->ok()) return false;
    }
    return true;
}

bool VerificationClient::matchesIdentity(const std::string& body) const {
    if (!Json::isObject(body)) return false;

    auto service = Json::findScalar(body, m_config.identityField);
    if (!service) return false;
    if (lower(*service).find(m_expectedServiceLower) == std::string::npos) return false;

    bool patternConfigured = m_versionPattern.has_value() || m_versionPatternInvalid;
    if (patternConfigured) {
        auto version = Json::findScalar(body, m_config.versionField);
        if (!version || !versionMatches(*version)) return false;
    }

    for (const auto& field : m_config.requiredFields) {
        if (!Json::hasField(body, field)) return false;
    }
    return true;
}

bool VerificationClient::versionMatches(const std::string& version) const {
    if (m_versionPatternInvalid || !m_versionPattern) return false;
    return std::regex_search(version, *m_versionPattern);
}

} // namespace Elixir
