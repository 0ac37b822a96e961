// Endpoint.hpp
// Address helpers shared by candidate generation, verification and consumers
#pragma once

#include <optional>
#include <string>

namespace Elixir {

// Parsed "scheme://host:port[/path]" base address.
struct Endpoint {
    std::string scheme;   // http, https, ws, wss
    std::string host;     // hostname or dotted IPv4
    int port{0};          // explicit or scheme default

    static std::optional<Endpoint> parse(const std::string& url);

    std::string toString() const;

    // Stream (push) address paired with an API address: same host and port,
    // http -> ws, https -> wss. Returns empty string if apiAddress is unparsable.
    static std::string streamAddressFor(const std::string& apiAddress);
};

// Join a base address and an endpoint path with exactly one '/' between them.
std::string joinUrl(const std::string& base, const std::string& path);

// Build "http://host:port".
std::string httpAddress(const std::string& host, int port);

namespace Ipv4 {

bool isIpv4(const std::string& address);
bool isLoopback(const std::string& address);     // 127.0.0.0/8
bool isLinkLocal(const std::string& address);    // 169.254.0.0/16
bool isPrivate(const std::string& address);      // 10/8, 172.16/12, 192.168/16

// "a.b.c.d" -> "a.b.c"; empty string if not IPv4.
std::string prefix24(const std::string& address);

} // namespace Ipv4

} // namespace Elixir
