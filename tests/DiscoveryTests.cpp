#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../src/BackendConnection.hpp"
#include "../src/DiscoveryCoordinator.hpp"
#include "../src/Endpoint.hpp"
#include "../src/Prober.hpp"
#include "TestFakes.hpp"

using namespace Elixir;
using namespace std::chrono;
using TestFakes::FakeHttpClient;
using TestFakes::FakeInferrer;
using TestFakes::Route;

static int failures = 0;

static void expect(bool ok, const std::string& what) {
    if (!ok) {
        std::cerr << "[FAIL] " << what << "\n";
        ++failures;
    }
}

static std::vector<std::string> numberedCandidates(int n) {
    std::vector<std::string> out;
    for (int i = 1; i <= n; ++i) out.push_back("http://10.0.0." + std::to_string(i) + ":8000");
    return out;
}

// Small, fast scan: loopback plus one fallback, nothing else.
static DiscoveryConfig smallConfig() {
    DiscoveryConfig config;
    config.requestTimeout = milliseconds(500);
    config.networkPrefixes = {};
    config.fallbackAddresses = {"http://raspberrypi.local:8000"};
    config.batchSize = 4;
    return config;
}

struct EventLog {
    std::mutex mutex;
    std::vector<DiscoveryEvent> events;

    void add(const DiscoveryEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(e);
    }
    int count(DiscoveryEvent::Type type) {
        std::lock_guard<std::mutex> lock(mutex);
        int n = 0;
        for (const auto& e : events) if (e.type == type) ++n;
        return n;
    }
};

int main() {
    // Test 1: never more than batchSize probes at once
    {
        std::cout << "[TEST] Prober concurrency bound" << std::endl;
        std::atomic<int> inFlight{0};
        std::atomic<int> maxInFlight{0};
        std::atomic<int> calls{0};
        Prober prober([&](const std::string&) {
            int now = ++inFlight;
            int seen = maxInFlight.load();
            while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {}
            ++calls;
            std::this_thread::sleep_for(milliseconds(20));
            --inFlight;
            return false;
        }, 7);

        auto found = prober.probe(numberedCandidates(50));
        expect(!found, "nothing verifies -> none found");
        expect(calls == 50, "every candidate probed once, got " + std::to_string(calls.load()));
        expect(maxInFlight <= 7, "max in flight " + std::to_string(maxInFlight.load()) + " exceeds batch size 7");
    }

    // Test 2: empty candidate list returns immediately
    {
        std::cout << "[TEST] Prober empty list" << std::endl;
        std::atomic<int> calls{0};
        Prober prober([&](const std::string&) { ++calls; return true; }, 20);
        expect(!prober.probe({}), "empty list -> none found");
        expect(calls == 0, "verifier not called for empty list");
    }

    // Test 3: a success stops later batches
    {
        std::cout << "[TEST] Prober short-circuit" << std::endl;
        auto candidates = numberedCandidates(12);
        std::atomic<int> calls{0};
        Prober prober([&](const std::string& c) { ++calls; return c == "http://10.0.0.4:8000"; }, 5);
        auto found = prober.probe(candidates);
        expect(found == std::string("http://10.0.0.4:8000"), "success in first batch returned");
        expect(calls == 5, "only the first batch probed, got " + std::to_string(calls.load()));

        calls = 0;
        Prober late([&](const std::string& c) { ++calls; return c == "http://10.0.0.12:8000"; }, 5);
        expect(late.probe(candidates) == std::string("http://10.0.0.12:8000"), "success in last batch returned");
        expect(calls == 12, "all batches probed when success is last");
    }

    // Test 4: slow failure and fast success in one batch
    {
        std::cout << "[TEST] Prober slow failure / fast success" << std::endl;
        Prober prober([](const std::string& c) {
            if (c == "A") { std::this_thread::sleep_for(milliseconds(300)); return false; }
            std::this_thread::sleep_for(milliseconds(20));
            return true;
        }, 2);
        auto start = steady_clock::now();
        auto found = prober.probe({"A", "B"});
        auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
        expect(found == std::string("B"), "fast success wins");
        expect(elapsed >= milliseconds(290), "batch still settles before returning (" + std::to_string(elapsed.count()) + " ms)");
    }

    // Test 5: progress reports every settled candidate
    {
        std::cout << "[TEST] Prober progress" << std::endl;
        std::vector<std::size_t> tested;
        std::size_t reportedTotal = 0;
        Prober prober([](const std::string&) { return false; }, 3);
        prober.probe(numberedCandidates(8), [&](const std::string&, std::size_t t, std::size_t total) {
            tested.push_back(t);
            reportedTotal = total;
        });
        expect(tested.size() == 8 && tested.back() == 8, "progress reaches 8/8");
        expect(reportedTotal == 8, "total reported");
    }

    // Test 6: a verified override short-circuits everything else
    {
        std::cout << "[TEST] Coordinator operator override" << std::endl;
        auto config = smallConfig();
        config.overrideApiAddress = "http://10.9.9.9:8000";
        FakeHttpClient http;
        http.route("http://10.9.9.9:8000/health", {200, TestFakes::kHealthyBody});
        http.route("http://localhost:8000/health", {200, TestFakes::kHealthyBody});
        FakeInferrer inferrer(std::string("192.168.1.40"));
        DiscoveryCoordinator coordinator(config, http, inferrer);

        auto result = coordinator.discover();
        expect(result.apiAddress == "http://10.9.9.9:8000" && result.verified, "override resolved");
        expect(result.streamAddress == "ws://10.9.9.9:8000", "override stream derived");
        expect(http.requests().size() == 1, "only the override was probed, got " + std::to_string(http.requests().size()));
        expect(inferrer.calls() == 0, "local address not needed");
    }

    // Test 7: stream override honoured only when it names the same host and port
    {
        std::cout << "[TEST] Coordinator stream override" << std::endl;
        auto config = smallConfig();
        config.overrideApiAddress = "https://chamber.local:8443";
        config.overrideStreamAddress = "wss://chamber.local:8443";
        FakeHttpClient http;
        http.route("https://chamber.local:8443/health", {200, TestFakes::kHealthyBody});
        FakeInferrer inferrer;
        {
            DiscoveryCoordinator coordinator(config, http, inferrer);
            expect(coordinator.discover().streamAddress == "wss://chamber.local:8443", "matching stream override kept");
        }
        config.overrideStreamAddress = "ws://10.1.1.1:9000";
        {
            DiscoveryCoordinator coordinator(config, http, inferrer);
            expect(coordinator.discover().streamAddress == "wss://chamber.local:8443", "mismatched stream override replaced");
        }
    }

    // Test 8: a failing override falls through to the scan
    {
        std::cout << "[TEST] Coordinator failing override" << std::endl;
        auto config = smallConfig();
        config.overrideApiAddress = "http://10.9.9.9:8000";
        FakeHttpClient http;
        http.route("http://127.0.0.1:8000/health", {200, TestFakes::kHealthyBody});
        FakeInferrer inferrer;
        DiscoveryCoordinator coordinator(config, http, inferrer);
        auto result = coordinator.discover();
        expect(result.apiAddress == "http://127.0.0.1:8000" && result.verified, "scan found loopback backend");
        expect(http.count("http://10.9.9.9:8000/health") == 1, "override probed once");
    }

    // Test 9: concurrent callers share one scan
    {
        std::cout << "[TEST] Coordinator in-flight sharing" << std::endl;
        auto config = smallConfig();
        FakeHttpClient http;
        http.route("http://localhost:8000/health", {200, TestFakes::kHealthyBody, milliseconds(150)});
        FakeInferrer inferrer;
        DiscoveryCoordinator coordinator(config, http, inferrer);
        EventLog log;
        coordinator.subscribe([&log](const DiscoveryEvent& e) { log.add(e); });

        std::vector<std::future<DiscoveryResult>> callers;
        for (int i = 0; i < 8; ++i) {
            callers.push_back(std::async(std::launch::async, [&coordinator] { return coordinator.discover(); }));
        }
        std::vector<DiscoveryResult> results;
        for (auto& f : callers) results.push_back(f.get());

        bool same = true;
        for (const auto& r : results) same = same && r.apiAddress == results.front().apiAddress && r.streamAddress == results.front().streamAddress;
        expect(same, "all callers observe the same result");
        expect(results.front().apiAddress == "http://localhost:8000", "loopback backend found");
        expect(log.count(DiscoveryEvent::Type::Started) == 1, "exactly one scan started");
        expect(inferrer.calls() == 1, "local address inferred once");
        expect(http.count("http://localhost:8000/health") == 1, "backend probed once");
        expect(coordinator.state() == DiscoveryCoordinator::State::Resolved, "state resolved");
    }

    // Test 10: exhaustion degrades to the first fallback and reports failure
    {
        std::cout << "[TEST] Coordinator exhaustion" << std::endl;
        auto config = smallConfig();
        FakeHttpClient http;
        FakeInferrer inferrer;   // unknown local address
        DiscoveryCoordinator coordinator(config, http, inferrer);
        EventLog log;
        coordinator.subscribe([&log](const DiscoveryEvent& e) { log.add(e); });

        expect(!coordinator.currentResult(), "no result before discovery");
        expect(coordinator.state() == DiscoveryCoordinator::State::Idle, "idle before discovery");

        auto result = coordinator.discover();
        expect(result.apiAddress == "http://raspberrypi.local:8000", "fallback used: " + result.apiAddress);
        expect(result.streamAddress == "ws://raspberrypi.local:8000", "fallback stream derived");
        expect(!result.verified, "fallback marked unverified");
        expect(log.count(DiscoveryEvent::Type::Failed) == 1, "discovery-failed emitted");
        expect(log.count(DiscoveryEvent::Type::Completed) == 0, "discovery-completed not emitted");
        expect(log.count(DiscoveryEvent::Type::Progress) == 3, "loopback x2 + fallback probed");
        expect(coordinator.currentResult().has_value(), "fallback held as resolved");

        DiscoveryConfig bare = smallConfig();
        bare.fallbackAddresses = {};
        DiscoveryCoordinator bareCoordinator(bare, http, inferrer);
        expect(bareCoordinator.discover().apiAddress == "http://localhost:8000", "no fallbacks -> loopback guess");
    }

    // Test 11: reset during a scan does not abort it
    {
        std::cout << "[TEST] Coordinator reset mid-discovery" << std::endl;
        auto config = smallConfig();
        FakeHttpClient http;
        http.route("http://localhost:8000/health", {200, TestFakes::kHealthyBody, milliseconds(200)});
        FakeInferrer inferrer;
        DiscoveryCoordinator coordinator(config, http, inferrer);
        EventLog log;
        coordinator.subscribe([&log](const DiscoveryEvent& e) { log.add(e); });

        auto pending = coordinator.discoverAsync();
        std::this_thread::sleep_for(milliseconds(50));
        coordinator.reset();
        expect(coordinator.state() == DiscoveryCoordinator::State::Discovering, "still discovering after reset");

        auto result = pending.get();
        // The worker publishes before fulfilling the future, so state is settled here.
        expect(coordinator.state() == DiscoveryCoordinator::State::Resolved, "in-flight scan resolved");
        expect(coordinator.discover().apiAddress == result.apiAddress, "later discover reuses result");
        expect(log.count(DiscoveryEvent::Type::Started) == 1, "no second scan");
    }

    // Test 12: reset after resolution forces a fresh scan with a cold cache
    {
        std::cout << "[TEST] Coordinator reset and rediscover" << std::endl;
        auto config = smallConfig();
        FakeHttpClient http;
        http.route("http://127.0.0.1:8000/health", {200, TestFakes::kHealthyBody});
        FakeInferrer inferrer;
        DiscoveryCoordinator coordinator(config, http, inferrer);

        coordinator.discover();
        coordinator.discover();
        expect(http.count("http://127.0.0.1:8000/health") == 1, "resolved result reused");

        coordinator.reset();
        expect(!coordinator.currentResult(), "reset clears result");
        expect(coordinator.cache().size() == 0, "reset clears cache");
        coordinator.discover();
        expect(http.count("http://127.0.0.1:8000/health") == 2, "rescan re-probes backend");
        expect(inferrer.calls() == 2, "rescan re-infers local address");
    }

    // Test 13: event stream order and unsubscribe
    {
        std::cout << "[TEST] Coordinator events" << std::endl;
        auto config = smallConfig();
        FakeHttpClient http;
        http.route("http://raspberrypi.local:8000/health", {200, TestFakes::kHealthyBody});
        FakeInferrer inferrer;
        DiscoveryCoordinator coordinator(config, http, inferrer);
        EventLog log;
        auto id = coordinator.subscribe([&log](const DiscoveryEvent& e) { log.add(e); });
        coordinator.subscribe([](const DiscoveryEvent&) { throw std::runtime_error("listener bug"); });

        auto result = coordinator.discover();
        expect(result.verified && result.apiAddress == "http://raspberrypi.local:8000", "fallback host verified as real backend");
        {
            std::lock_guard<std::mutex> lock(log.mutex);
            expect(!log.events.empty() && log.events.front().type == DiscoveryEvent::Type::Started, "started first");
            expect(!log.events.empty() && log.events.back().type == DiscoveryEvent::Type::Completed, "completed last");
            expect(!log.events.empty() && log.events.back().result && log.events.back().result->apiAddress == result.apiAddress, "completed carries result");
        }

        coordinator.unsubscribe(id);
        size_t before = log.events.size();
        coordinator.reset();
        coordinator.discover();
        expect(log.events.size() == before, "unsubscribed listener receives nothing");
    }

    // Test 14: API and stream addresses differ only in scheme
    {
        std::cout << "[TEST] Result address pairing" << std::endl;
        for (const std::string api : {"http://192.168.1.20:8000", "https://chamber.local:8443", "http://localhost"}) {
            auto r = DiscoveryResult::fromApiAddress(api, true);
            auto a = Endpoint::parse(r.apiAddress);
            auto s = Endpoint::parse(r.streamAddress);
            expect(a && s && a->host == s->host && a->port == s->port && a->scheme != s->scheme, "pairing for " + api);
        }
    }

    // Test 15: connection monitor and reconnect policy
    {
        std::cout << "[TEST] Backend connection" << std::endl;
        auto config = smallConfig();
        config.maxReconnectAttempts = 5;
        FakeHttpClient http;
        http.route("http://localhost:8000/health", {200, TestFakes::kHealthyBody});
        FakeInferrer inferrer;
        DiscoveryCoordinator coordinator(config, http, inferrer);
        BackendConnection connection(config, coordinator, http);

        auto state = connection.refresh();
        expect(state.connected && state.verified, "connected after refresh");
        expect(state.apiUrl == "http://localhost:8000" && state.streamUrl == "ws://localhost:8000", "urls recorded");
        expect(state.lastDiscovery.has_value(), "discovery time recorded");
        expect(connection.apiUrl("/api/sensors/readings") == "http://localhost:8000/api/sensors/readings", "api url built");
        expect(connection.streamUrl("/ws/system-status") == "ws://localhost:8000/ws/system-status", "stream url built");
        expect(connection.testConnection(), "health reachable");

        expect(connection.onStreamClosed() && connection.onStreamClosed(), "first reconnects allowed");
        expect(coordinator.currentResult().has_value(), "no rediscovery before third attempt");
        expect(connection.onStreamClosed(), "third reconnect allowed");
        expect(!coordinator.currentResult().has_value(), "third attempt resets discovery");
        expect(connection.onStreamClosed() && connection.onStreamClosed(), "fourth and fifth allowed");
        expect(!connection.onStreamClosed(), "sixth refused");
        connection.onStreamOpened();
        expect(connection.reconnectAttempts() == 0, "open resets attempt count");

        http.route("http://localhost:8000/health", {503, "{}"});
        auto down = connection.resetAndDiscover();
        expect(!down.connected && !down.error.empty(), "unreachable backend reported");
    }

    // Test 16: a listener that asks for the result mid-scan does not stall discovery
    {
        std::cout << "[TEST] Listener re-entry" << std::endl;
        auto config = smallConfig();
        FakeHttpClient http;
        http.route("http://127.0.0.1:8000/health", {200, TestFakes::kHealthyBody, milliseconds(50)});
        FakeInferrer inferrer;
        DiscoveryCoordinator coordinator(config, http, inferrer);

        std::mutex mutex;
        std::vector<std::pair<DiscoveryEvent::Type, DiscoveryResult>> seen;
        coordinator.subscribe([&](const DiscoveryEvent& e) {
            DiscoveryResult inner = coordinator.discover();
            std::lock_guard<std::mutex> lock(mutex);
            seen.emplace_back(e.type, inner);
        });

        auto outer = std::async(std::launch::async, [&coordinator] { return coordinator.discover(); });
        bool finished = outer.wait_for(seconds(5)) == std::future_status::ready;
        expect(finished, "discover() returns when a listener calls it during the scan");
        if (finished) {
            auto result = outer.get();
            expect(result.verified && result.apiAddress == "http://127.0.0.1:8000", "scan still resolves: " + result.apiAddress);
            expect(coordinator.state() == DiscoveryCoordinator::State::Resolved, "coordinator resolved");

            std::lock_guard<std::mutex> lock(mutex);
            bool startedFallback = false, progressFallback = false, completedResolved = false;
            for (const auto& entry : seen) {
                if (entry.first == DiscoveryEvent::Type::Started)
                    startedFallback = !entry.second.verified && entry.second.apiAddress == "http://raspberrypi.local:8000";
                if (entry.first == DiscoveryEvent::Type::Progress && !entry.second.verified) progressFallback = true;
                if (entry.first == DiscoveryEvent::Type::Completed) completedResolved = entry.second.verified;
            }
            expect(startedFallback, "listener on start gets the unverified fallback");
            expect(progressFallback, "listener on progress gets an immediate answer");
            expect(completedResolved, "listener on completion sees the resolved result");
        }
    }

    if (failures == 0) {
        std::cout << "ALL TESTS PASS" << std::endl;
        return 0;
    } else {
        std::cout << failures << " TEST(S) FAILED" << std::endl;
        return 1;
    }
}
