// CandidateGenerator.cpp
#include "CandidateGenerator.hpp"

#include <algorithm>
#include <unordered_set>

#include "Endpoint.hpp"

namespace Elixir {

std::vector<std::string> dedupePreservingOrder(const std::vector<std::string>& addresses) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    out.reserve(addresses.size());
    for (const auto& a : addresses) {
        if (a.empty()) continue;
        if (seen.insert(a).second) out.push_back(a);
    }
    return out;
}

CandidateGenerator::CandidateGenerator(const DiscoveryConfig& config) : m_config(config) {}

std::vector<int> CandidateGenerator::hostNumbers() const {
    std::vector<int> hosts;
    if (m_config.quickScan) {
        for (int h : m_config.quickScanHosts) {
            if (h >= 1 && h <= 254) hosts.push_back(h);
        }
        return hosts;
    }
    int start = std::max(1, m_config.hostRangeStart);
    int end = std::min(254, m_config.hostRangeEnd);
    for (int h = start; h <= end; ++h) hosts.push_back(h);
    return hosts;
}

std::vector<std::string> CandidateGenerator::orderedPrefixes(const std::optional<std::string>& localAddress) const {
    std::vector<std::string> prefixes = m_config.networkPrefixes;
    if (localAddress && Ipv4::isPrivate(*localAddress)) {
        std::string observed = Ipv4::prefix24(*localAddress);
        prefixes.erase(std::remove(prefixes.begin(), prefixes.end(), observed), prefixes.end());
        prefixes.insert(prefixes.begin(), observed);
    }
    return prefixes;
}

std::vector<std::string> CandidateGenerator::generate(const std::optional<std::string>& localAddress) const {
    const int port = m_config.defaultPort;
    std::vector<std::string> candidates;

    candidates.push_back(httpAddress("localhost", port));
    candidates.push_back(httpAddress("127.0.0.1", port));

    if (localAddress && !localAddress->empty()) {
        candidates.push_back(httpAddress(*localAddress, port));
    }

    const auto hosts = hostNumbers();
    for (const auto& prefix : orderedPrefixes(localAddress)) {
        for (int h : hosts) {
            candidates.push_back(httpAddress(prefix + "." + std::to_string(h), port));
        }
    }

    candidates.insert(candidates.end(), m_config.fallbackAddresses.begin(), m_config.fallbackAddresses.end());

    return dedupePreservingOrder(candidates);
}

} // namespace Elixir
