// CandidateGenerator.hpp
// Ordered, de-duplicated list of base addresses worth probing, most likely first
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "DiscoveryConfig.hpp"

namespace Elixir {

class CandidateGenerator {
public:
    explicit CandidateGenerator(const DiscoveryConfig& config);

    // Order: loopback, the machine's own address, prefix x host expansion
    // (observed prefix first), fallbacks. The operator override is handled by
    // the coordinator before this list is ever built. Never fails.
    std::vector<std::string> generate(const std::optional<std::string>& localAddress) const;

    // Prefix list after observed-network promotion.
    std::vector<std::string> orderedPrefixes(const std::optional<std::string>& localAddress) const;

    // Host numbers expanded per prefix (full range or quick-scan list).
    std::vector<int> hostNumbers() const;

private:
    DiscoveryConfig m_config;
};

// Keeps the first occurrence of each address, preserving order.
std::vector<std::string> dedupePreservingOrder(const std::vector<std::string>& addresses);

} // namespace Elixir
