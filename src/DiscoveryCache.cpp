// DiscoveryCache.cpp
#include "DiscoveryCache.hpp"

#include <utility>

namespace Elixir {

DiscoveryCache::DiscoveryCache(std::chrono::seconds ttl, TimeSource now)
    : m_ttl(ttl), m_now(std::move(now)) {}

std::optional<DiscoveryCache::Entry> DiscoveryCache::get(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(address);
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
}

std::optional<DiscoveryCache::Entry> DiscoveryCache::getFresh(const std::string& address) const {
    auto entry = get(address);
    if (!entry || !isFresh(*entry)) return std::nullopt;
    return entry;
}

bool DiscoveryCache::isFresh(const Entry& entry) const {
    return m_now() - entry.checkedAt <= m_ttl;
}

void DiscoveryCache::set(const std::string& address, bool valid) {
    auto now = m_now();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[address] = Entry{valid, now};
}

void DiscoveryCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

std::size_t DiscoveryCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace Elixir
