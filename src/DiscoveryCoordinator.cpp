// DiscoveryCoordinator.cpp
#include "DiscoveryCoordinator.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

#include "Endpoint.hpp"
#include "LocalAddressInferrer.hpp"

namespace Elixir {

namespace {

// Coordinator whose listeners are running on this thread, if any.
thread_local const DiscoveryCoordinator* t_publishing = nullptr;

std::shared_future<DiscoveryResult> readyFuture(const DiscoveryResult& result) {
    std::promise<DiscoveryResult> ready;
    ready.set_value(result);
    return ready.get_future().share();
}

} // anonymous namespace

DiscoveryResult DiscoveryResult::fromApiAddress(const std::string& apiAddress, bool verified) {
    DiscoveryResult result;
    auto ep = Endpoint::parse(apiAddress);
    result.apiAddress = ep ? ep->toString() : apiAddress;
    result.streamAddress = Endpoint::streamAddressFor(result.apiAddress);
    result.verified = verified;
    return result;
}

const char* toString(DiscoveryEvent::Type type) {
    switch (type) {
        case DiscoveryEvent::Type::Started: return "discovery-started";
        case DiscoveryEvent::Type::Progress: return "discovery-progress";
        case DiscoveryEvent::Type::Completed: return "discovery-completed";
        case DiscoveryEvent::Type::Failed: return "discovery-failed";
    }
    return "unknown";
}

const char* toString(DiscoveryCoordinator::State state) {
    switch (state) {
        case DiscoveryCoordinator::State::Idle: return "idle";
        case DiscoveryCoordinator::State::Discovering: return "discovering";
        case DiscoveryCoordinator::State::Resolved: return "resolved";
    }
    return "unknown";
}

DiscoveryCoordinator::DiscoveryCoordinator(const DiscoveryConfig& config, HttpClient& http,
                                           LocalAddressInferrer& inferrer, DiscoveryCache::TimeSource now)
    : m_config(config)
    , m_inferrer(inferrer)
    , m_cache(config.cacheTtl, std::move(now))
    , m_verifier(m_config, http, m_cache)
    , m_generator(m_config)
    , m_prober([this](const std::string& candidate) { return m_verifier.verify(candidate); }, config.batchSize) {}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    if (m_worker.joinable()) m_worker.join();
}

DiscoveryResult DiscoveryCoordinator::discover() {
    return discoverAsync().get();
}

std::shared_future<DiscoveryResult> DiscoveryCoordinator::discoverAsync() {
    std::thread previous;
    std::shared_future<DiscoveryResult> future;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_resolved) return readyFuture(*m_resolved);
        if (m_inFlight) {
            // A listener waiting on the scan that is calling it would never return.
            if (t_publishing == this) {
                std::cerr << "[Discovery] discover() called from a listener during a scan; answering with the fallback" << std::endl;
                return readyFuture(DiscoveryResult::fromApiAddress(fallbackAddress(), false));
            }
            return *m_inFlight;
        }

        auto promise = std::make_shared<std::promise<DiscoveryResult>>();
        future = promise->get_future().share();
        m_inFlight = future;
        previous = std::move(m_worker);

        try {
            m_worker = std::thread([this, promise]() {
                DiscoveryResult result = runDiscovery();
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_resolved = result;
                    m_inFlight.reset();
                }
                DiscoveryEvent done;
                done.type = result.verified ? DiscoveryEvent::Type::Completed : DiscoveryEvent::Type::Failed;
                done.result = result;
                publish(done);
                promise->set_value(result);
            });
        } catch (const std::system_error& e) {
            std::cerr << "[Discovery] Cannot start discovery worker: " << e.what() << std::endl;
            m_inFlight.reset();
            promise->set_value(fallbackResult());
        }
    }

    // The previous worker has already published its result; it may still be
    // inside a listener, possibly this very call.
    if (previous.joinable()) {
        if (previous.get_id() == std::this_thread::get_id()) previous.detach();
        else previous.join();
    }
    return future;
}

void DiscoveryCoordinator::reset() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_resolved.reset();
    }
    m_cache.clear();
    std::cout << "[Discovery] Reset; next request will rescan" << std::endl;
}

std::optional<DiscoveryResult> DiscoveryCoordinator::currentResult() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_resolved;
}

DiscoveryCoordinator::State DiscoveryCoordinator::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_resolved) return State::Resolved;
    if (m_inFlight) return State::Discovering;
    return State::Idle;
}

DiscoveryCoordinator::ListenerId DiscoveryCoordinator::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    ListenerId id = m_nextListenerId++;
    m_listeners.emplace_back(id, std::move(listener));
    return id;
}

void DiscoveryCoordinator::unsubscribe(ListenerId id) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
                                     [id](const auto& entry) { return entry.first == id; }),
                      m_listeners.end());
}

void DiscoveryCoordinator::publish(const DiscoveryEvent& event) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_listenerMutex);
        for (const auto& entry : m_listeners) listeners.push_back(entry.second);
    }
    const DiscoveryCoordinator* outer = t_publishing;
    t_publishing = this;
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            std::cerr << "[Discovery] Listener failed on " << toString(event.type) << ": " << e.what() << std::endl;
        }
    }
    t_publishing = outer;
}

std::optional<DiscoveryResult> DiscoveryCoordinator::tryOverride() {
    if (!m_config.overrideApiAddress) return std::nullopt;
    const std::string& api = *m_config.overrideApiAddress;

    std::cout << "[Discovery] Checking configured address " << api << std::endl;
    if (!m_verifier.verify(api)) {
        std::cerr << "[Discovery] Configured address " << api << " did not verify; scanning" << std::endl;
        return std::nullopt;
    }

    DiscoveryResult result = DiscoveryResult::fromApiAddress(api, true);
    if (m_config.overrideStreamAddress) {
        auto apiEp = Endpoint::parse(result.apiAddress);
        auto wsEp = Endpoint::parse(*m_config.overrideStreamAddress);
        if (apiEp && wsEp && apiEp->host == wsEp->host && apiEp->port == wsEp->port) {
            result.streamAddress = wsEp->toString();
        } else {
            std::cerr << "[Discovery] Ignoring stream override " << *m_config.overrideStreamAddress
                      << " (host/port differ from " << result.apiAddress << ")" << std::endl;
        }
    }
    return result;
}

std::string DiscoveryCoordinator::fallbackAddress() const {
    return m_config.fallbackAddresses.empty()
        ? httpAddress("localhost", m_config.defaultPort)
        : m_config.fallbackAddresses.front();
}

DiscoveryResult DiscoveryCoordinator::fallbackResult() const {
    std::string address = fallbackAddress();
    // TODO: confirm with chamber operators whether an unverified fallback should
    // be handed out at all, or reported as "no backend" instead.
    std::cerr << "[Discovery] No backend verified; falling back to " << address << std::endl;
    return DiscoveryResult::fromApiAddress(address, false);
}

DiscoveryResult DiscoveryCoordinator::runDiscovery() {
    DiscoveryEvent started;
    started.type = DiscoveryEvent::Type::Started;
    publish(started);
    std::cout << "[Discovery] Searching for control server..." << std::endl;

    try {
        if (auto overridden = tryOverride()) {
            std::cout << "[Discovery] Using configured address " << overridden->apiAddress << std::endl;
            return *overridden;
        }

        auto local = m_inferrer.inferLocalAddress();
        auto candidates = m_generator.generate(local);
        if (m_config.overrideApiAddress) {
            candidates.erase(std::remove(candidates.begin(), candidates.end(), *m_config.overrideApiAddress),
                             candidates.end());
        }
        std::cout << "[Discovery] Probing " << candidates.size() << " candidates in batches of "
                  << m_prober.batchSize() << (m_config.quickScan ? " (quick scan)" : "") << std::endl;

        auto found = m_prober.probe(candidates, [this](const std::string& candidate, std::size_t tested, std::size_t total) {
            DiscoveryEvent progress;
            progress.type = DiscoveryEvent::Type::Progress;
            progress.candidate = candidate;
            progress.tested = tested;
            progress.total = total;
            publish(progress);
        });
        if (found) {
            auto result = DiscoveryResult::fromApiAddress(*found, true);
            std::cout << "[Discovery] Found control server at " << result.apiAddress << std::endl;
            return result;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Discovery] Scan aborted: " << e.what() << std::endl;
    }
    return fallbackResult();
}

} // namespace Elixir
