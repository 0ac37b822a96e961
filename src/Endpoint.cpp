// Endpoint.cpp
#include "Endpoint.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace Elixir {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int defaultPortFor(const std::string& scheme) {
    if (scheme == "https" || scheme == "wss") return 443;
    return 80;
}

bool parseIpv4(const std::string& address, std::uint32_t& out) {
    in_addr addr{};
    if (inet_pton(AF_INET, address.c_str(), &addr) != 1) return false;
    out = ntohl(addr.s_addr);
    return true;
}

} // anonymous namespace

std::optional<Endpoint> Endpoint::parse(const std::string& url) {
    const std::string sep = "://";
    size_t schemeEnd = url.find(sep);
    if (schemeEnd == std::string::npos || schemeEnd == 0) return std::nullopt;

    Endpoint ep;
    ep.scheme = lower(url.substr(0, schemeEnd));
    if (ep.scheme != "http" && ep.scheme != "https" && ep.scheme != "ws" && ep.scheme != "wss") {
        return std::nullopt;
    }

    size_t hostStart = schemeEnd + sep.size();
    size_t hostEnd = url.find('/', hostStart);
    std::string authority = url.substr(hostStart, hostEnd == std::string::npos ? std::string::npos : hostEnd - hostStart);
    if (authority.empty()) return std::nullopt;

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string portStr = authority.substr(colon + 1);
        if (portStr.empty() || !std::all_of(portStr.begin(), portStr.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) return std::nullopt;
        try {
            ep.port = std::stoi(portStr);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (ep.port <= 0 || ep.port > 65535) return std::nullopt;
        ep.host = authority.substr(0, colon);
    } else {
        ep.host = authority;
        ep.port = defaultPortFor(ep.scheme);
    }
    if (ep.host.empty()) return std::nullopt;
    return ep;
}

std::string Endpoint::toString() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::string Endpoint::streamAddressFor(const std::string& apiAddress) {
    auto ep = parse(apiAddress);
    if (!ep) return {};
    if (ep->scheme == "http") ep->scheme = "ws";
    else if (ep->scheme == "https") ep->scheme = "wss";
    return ep->toString();
}

std::string joinUrl(const std::string& base, const std::string& path) {
    std::string b = base;
    if (!b.empty() && b.back() == '/') b.pop_back();
    if (path.empty()) return b;
    return path.front() == '/' ? b + path : b + "/" + path;
}

std::string httpAddress(const std::string& host, int port) {
    return "http://" + host + ":" + std::to_string(port);
}

namespace Ipv4 {

bool isIpv4(const std::string& address) {
    std::uint32_t v = 0;
    return parseIpv4(address, v);
}

bool isLoopback(const std::string& address) {
    std::uint32_t v = 0;
    return parseIpv4(address, v) && (v >> 24) == 127;
}

bool isLinkLocal(const std::string& address) {
    std::uint32_t v = 0;
    return parseIpv4(address, v) && (v >> 16) == 0xA9FE;
}

bool isPrivate(const std::string& address) {
    std::uint32_t v = 0;
    if (!parseIpv4(address, v)) return false;
    return (v >> 24) == 10
        || (v >> 20) == 0xAC1   // 172.16.0.0/12
        || (v >> 16) == 0xC0A8; // 192.168.0.0/16
}

std::string prefix24(const std::string& address) {
    if (!isIpv4(address)) return {};
    return address.substr(0, address.rfind('.'));
}

} // namespace Ipv4

} // namespace Elixir
