// DiscoveryCache.hpp
// Per-address verification outcomes, trusted for a fixed TTL
#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Elixir {

class DiscoveryCache {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    struct Entry {
        bool valid{false};
        Clock::time_point checkedAt;
    };

    explicit DiscoveryCache(std::chrono::seconds ttl = std::chrono::seconds(300),
                            TimeSource now = &Clock::now);

    // Raw entry, stale or not. Staleness is the reader's call (see isFresh).
    std::optional<Entry> get(const std::string& address) const;

    // Entry only if still within the TTL.
    std::optional<Entry> getFresh(const std::string& address) const;

    bool isFresh(const Entry& entry) const;

    void set(const std::string& address, bool valid);

    void clear();

    std::size_t size() const;
    std::chrono::seconds ttl() const { return m_ttl; }

private:
    std::chrono::seconds m_ttl;
    TimeSource m_now;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

} // namespace Elixir
