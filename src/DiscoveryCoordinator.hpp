// DiscoveryCoordinator.hpp
// Owns "which backend are we talking to": one discovery in flight at a time,
// result held until an explicit reset.
#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "CandidateGenerator.hpp"
#include "DiscoveryCache.hpp"
#include "DiscoveryConfig.hpp"
#include "Prober.hpp"
#include "VerificationClient.hpp"

namespace Elixir {

class HttpClient;
class LocalAddressInferrer;

struct DiscoveryResult {
    std::string apiAddress;      // http(s)://host:port
    std::string streamAddress;   // ws(s)://host:port, same host and port
    bool verified{false};        // false when resolved to a fallback guess

    static DiscoveryResult fromApiAddress(const std::string& apiAddress, bool verified);
};

struct DiscoveryEvent {
    enum class Type {
        Started,
        Progress,
        Completed,
        Failed   // exhausted; result carries the fallback in use
    };

    Type type{Type::Started};
    std::string candidate;       // Progress
    std::size_t tested{0};       // Progress
    std::size_t total{0};        // Progress
    std::optional<DiscoveryResult> result;   // Completed / Failed
};

const char* toString(DiscoveryEvent::Type type);

class DiscoveryCoordinator {
public:
    enum class State { Idle, Discovering, Resolved };

    using Listener = std::function<void(const DiscoveryEvent&)>;
    using ListenerId = std::size_t;

    // http and inferrer must outlive the coordinator.
    DiscoveryCoordinator(const DiscoveryConfig& config, HttpClient& http, LocalAddressInferrer& inferrer,
                         DiscoveryCache::TimeSource now = &DiscoveryCache::Clock::now);
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    // Blocks until a result is available. Idle -> Discovering on first call;
    // callers arriving while a scan runs share its outcome. Never throws.
    // Called from a listener while a scan runs, it returns the unverified
    // fallback at once instead of waiting on the scan it is part of.
    DiscoveryResult discover();

    // Non-blocking form of discover(): the shared outcome of the current (or a
    // newly started) discovery.
    std::shared_future<DiscoveryResult> discoverAsync();

    // Forget the resolved endpoint and every cached verification. A scan that
    // is already running is not aborted and will still publish its result.
    void reset();

    std::optional<DiscoveryResult> currentResult() const;
    State state() const;

    ListenerId subscribe(Listener listener);
    void unsubscribe(ListenerId id);

    DiscoveryCache& cache() { return m_cache; }

private:
    DiscoveryResult runDiscovery();
    std::optional<DiscoveryResult> tryOverride();
    std::string fallbackAddress() const;
    DiscoveryResult fallbackResult() const;
    void publish(const DiscoveryEvent& event);

    DiscoveryConfig m_config;
    LocalAddressInferrer& m_inferrer;
    DiscoveryCache m_cache;
    VerificationClient m_verifier;
    CandidateGenerator m_generator;
    Prober m_prober;

    mutable std::mutex m_mutex;
    std::optional<DiscoveryResult> m_resolved;
    std::optional<std::shared_future<DiscoveryResult>> m_inFlight;
    std::thread m_worker;

    std::mutex m_listenerMutex;
    std::vector<std::pair<ListenerId, Listener>> m_listeners;
    ListenerId m_nextListenerId{1};
};

const char* toString(DiscoveryCoordinator::State state);

} // namespace Elixir
