// verify_endpoint.cpp - check one address against the control server identity contract
#include <iostream>

#include "../src/DiscoveryCache.hpp"
#include "../src/DiscoveryConfig.hpp"
#include "../src/HttpClient.hpp"
#include "../src/VerificationClient.hpp"

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: verify_endpoint <http://host:port>" << std::endl;
        return 2;
    }

    Elixir::DiscoveryConfig config = Elixir::DiscoveryConfig::fromEnvironment();
    config.verbose = true;

    Elixir::CurlHttpClient http;
    Elixir::DiscoveryCache cache(config.cacheTtl);
    Elixir::VerificationClient verifier(config, http, cache);

    bool ok = verifier.verify(argv[1]);
    std::cout << (ok ? "PASS " : "FAIL ") << argv[1] << std::endl;
    return ok ? 0 : 1;
}
