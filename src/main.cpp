// main.cpp
#include "BackendConnection.hpp"
#include "DiscoveryConfig.hpp"
#include "DiscoveryCoordinator.hpp"
#include "Endpoint.hpp"
#include "HttpClient.hpp"
#include "LocalAddressInferrer.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void handleSignal(int) {
    g_running = false;
}

void printUsage() {
    std::cout << "Usage: elixir-discover [options]\n"
              << "  --api=URL            operator override for the API address\n"
              << "  --ws=URL             operator override for the stream address\n"
              << "  --quick              probe only common host numbers per prefix\n"
              << "  --batch=N            concurrent probes per batch\n"
              << "  --prefixes=a.b.c,..  private network prefixes to expand\n"
              << "  --service=NAME       expected service identity substring\n"
              << "  --verbose            log every candidate\n"
              << "  --watch              keep monitoring the connection\n"
              << "ELIXIR_* environment variables are applied first; flags override them." << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv) {
    using namespace Elixir;

    DiscoveryConfig config = DiscoveryConfig::fromEnvironment();
    bool watch = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        const std::string api = "--api=";
        const std::string ws = "--ws=";
        const std::string batch = "--batch=";
        const std::string prefixes = "--prefixes=";
        const std::string service = "--service=";

        if (arg.rfind(api, 0) == 0 || arg.rfind(ws, 0) == 0) {
            bool isApi = arg.rfind(api, 0) == 0;
            std::string address = arg.substr(isApi ? api.size() : ws.size());
            if (!Endpoint::parse(address)) {
                std::cerr << "[main] Expected scheme://host[:port] in " << arg << std::endl;
                return 1;
            }
            (isApi ? config.overrideApiAddress : config.overrideStreamAddress) = address;
        }
        else if (arg == "--quick") config.quickScan = true;
        else if (arg.rfind(batch, 0) == 0) {
            try {
                int n = std::stoi(arg.substr(batch.size()));
                if (n > 0) config.batchSize = static_cast<std::size_t>(n);
            } catch (const std::exception&) {
                std::cerr << "[main] Ignoring bad batch size: " << arg << std::endl;
            }
        }
        else if (arg.rfind(prefixes, 0) == 0) config.networkPrefixes = splitList(arg.substr(prefixes.size()));
        else if (arg.rfind(service, 0) == 0) config.expectedService = arg.substr(service.size());
        else if (arg == "--verbose") config.verbose = true;
        else if (arg == "--watch") watch = true;
        else if (arg == "--help" || arg == "-h") { printUsage(); return 0; }
        else {
            std::cerr << "[main] Unknown option: " << arg << std::endl;
            printUsage();
            return 1;
        }
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    CurlHttpClient http;
    StunLocalAddressInferrer inferrer(config.rendezvousHost, config.rendezvousPort,
                                      config.localAddressTimeout, config.verbose);
    DiscoveryCoordinator coordinator(config, http, inferrer);
    BackendConnection connection(config, coordinator, http);

    coordinator.subscribe([&config](const DiscoveryEvent& event) {
        switch (event.type) {
            case DiscoveryEvent::Type::Progress:
                if (config.verbose) {
                    std::cout << "[Discovery] " << event.tested << "/" << event.total << " tested (" << event.candidate << ")" << std::endl;
                }
                break;
            case DiscoveryEvent::Type::Completed:
            case DiscoveryEvent::Type::Failed:
                std::cout << "[Discovery] " << toString(event.type) << ": "
                          << (event.result ? event.result->apiAddress : std::string("-")) << std::endl;
                break;
            case DiscoveryEvent::Type::Started:
                break;
        }
    });

    ConnectionState state = connection.refresh();
    std::cout << "API:    " << state.apiUrl << "\n"
              << "Stream: " << state.streamUrl << "\n"
              << "Verified: " << (state.verified ? "yes" : "no (fallback)") << "\n"
              << "Reachable: " << (state.connected ? "yes" : "no") << std::endl;

    if (watch) {
        std::cout << "[main] Watching connection every " << config.connectionCheckInterval.count() << " ms (Ctrl+C to stop)" << std::endl;
        auto nextCheck = std::chrono::steady_clock::now() + config.connectionCheckInterval;
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            if (std::chrono::steady_clock::now() < nextCheck) continue;
            nextCheck = std::chrono::steady_clock::now() + config.connectionCheckInterval;

            if (connection.testConnection()) {
                connection.onStreamOpened();
                continue;
            }
            if (!connection.onStreamClosed()) {
                std::cerr << "[main] Giving up; rediscovering from scratch" << std::endl;
                state = connection.resetAndDiscover();
                if (state.connected) connection.onStreamOpened();
                continue;
            }
            std::this_thread::sleep_for(config.reconnectInterval);
            state = connection.refresh();
            if (state.connected) connection.onStreamOpened();
        }
    }

    return state.verified ? 0 : 2;
}
