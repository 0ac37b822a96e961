// LocalAddressInferrer.cpp
#include "LocalAddressInferrer.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/rand.h>

#include "Endpoint.hpp"

namespace Elixir {

using namespace std::chrono;

namespace {

struct Negotiation {
    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
    std::optional<std::string> result;
    std::atomic<bool> abandoned{false};

    void finish(std::optional<std::string> address) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (done) return;
            done = true;
            result = std::move(address);
        }
        cv.notify_all();
    }
};

class SocketGuard {
public:
    explicit SocketGuard(int fd) : m_fd(fd) {}
    ~SocketGuard() { if (m_fd >= 0) ::close(m_fd); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return m_fd; }
private:
    int m_fd;
};

std::uint16_t read16(const std::vector<std::uint8_t>& p, size_t off) {
    return static_cast<std::uint16_t>((p[off] << 8) | p[off + 1]);
}

std::uint32_t read32(const std::vector<std::uint8_t>& p, size_t off) {
    return (static_cast<std::uint32_t>(p[off]) << 24) | (static_cast<std::uint32_t>(p[off + 1]) << 16)
         | (static_cast<std::uint32_t>(p[off + 2]) << 8) | static_cast<std::uint32_t>(p[off + 3]);
}

std::string ipv4ToString(std::uint32_t hostOrder) {
    in_addr addr{};
    addr.s_addr = htonl(hostOrder);
    char buf[INET_ADDRSTRLEN] = {};
    if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf))) return {};
    return buf;
}

std::optional<std::string> hostCandidate(int fd) {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) != 0) return std::nullopt;
    if (local.sin_family != AF_INET) return std::nullopt;
    return ipv4ToString(ntohl(local.sin_addr.s_addr));
}

void negotiate(const std::shared_ptr<Negotiation>& state, const std::string& host, int port,
               steady_clock::time_point deadline, bool verbose) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (gai != 0 || !res) {
        if (verbose) std::cerr << "[LocalAddress] Cannot resolve " << host << ": " << gai_strerror(gai) << std::endl;
        state->finish(std::nullopt);
        return;
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> resGuard(res, &freeaddrinfo);
    if (state->abandoned) return;

    SocketGuard sock(::socket(res->ai_family, res->ai_socktype, res->ai_protocol));
    if (sock.get() < 0 || ::connect(sock.get(), res->ai_addr, res->ai_addrlen) != 0) {
        if (verbose) std::cerr << "[LocalAddress] UDP connect failed: " << std::strerror(errno) << std::endl;
        state->finish(std::nullopt);
        return;
    }

    Stun::TransactionId txid{};
    std::vector<std::uint8_t> request;
    if (Stun::randomTransactionId(txid)) {
        request = Stun::buildBindingRequest(txid);
        if (::send(sock.get(), request.data(), request.size(), 0) < 0 && verbose) {
            std::cerr << "[LocalAddress] STUN send failed: " << std::strerror(errno) << std::endl;
        }
    } else if (verbose) {
        std::cerr << "[LocalAddress] No secure random source; host candidate only" << std::endl;
    }

    // Host candidate is reported as soon as the socket has a route.
    if (auto local = hostCandidate(sock.get())) {
        if (verbose) std::cout << "[LocalAddress] host candidate " << *local << std::endl;
        if (isUsableLocalCandidate(*local)) {
            state->finish(local);
            return;
        }
    }
    if (request.empty()) {
        state->finish(std::nullopt);
        return;
    }

    auto nextRetransmit = steady_clock::now() + milliseconds(500);
    std::vector<std::uint8_t> buf(1500);
    while (!state->abandoned) {
        auto now = steady_clock::now();
        if (now >= deadline) break;
        if (now >= nextRetransmit) {
            if (::send(sock.get(), request.data(), request.size(), 0) < 0 && verbose) {
                std::cerr << "[LocalAddress] STUN resend failed: " << std::strerror(errno) << std::endl;
            }
            nextRetransmit = now + milliseconds(500);
        }
        auto slice = std::min(duration_cast<milliseconds>(deadline - now), milliseconds(100));
        pollfd pfd{sock.get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(slice.count()));
        if (ready <= 0 || !(pfd.revents & (POLLIN | POLLERR))) continue;

        // A pending ICMP error surfaces here; nothing is listening at the rendezvous.
        ssize_t n = ::recv(sock.get(), buf.data(), buf.size(), 0);
        if (n < 0 && errno == ECONNREFUSED) {
            if (verbose) std::cerr << "[LocalAddress] Rendezvous refused the binding request" << std::endl;
            break;
        }
        if (n <= 0) continue;
        std::vector<std::uint8_t> packet(buf.begin(), buf.begin() + n);
        auto reflexive = Stun::parseBindingResponse(packet, txid);
        if (!reflexive) continue;
        if (verbose) std::cout << "[LocalAddress] server-reflexive candidate " << *reflexive << std::endl;
        if (isUsableLocalCandidate(*reflexive)) {
            state->finish(reflexive);
            return;
        }
        break;
    }
    state->finish(std::nullopt);
}

} // anonymous namespace

bool isUsableLocalCandidate(const std::string& address) {
    return Ipv4::isIpv4(address) && !Ipv4::isLoopback(address) && !Ipv4::isLinkLocal(address)
        && address != "0.0.0.0";
}

StunLocalAddressInferrer::StunLocalAddressInferrer(std::string rendezvousHost, int rendezvousPort,
                                                   std::chrono::milliseconds timeout, bool verbose)
    : m_host(std::move(rendezvousHost)), m_port(rendezvousPort), m_timeout(timeout), m_verbose(verbose) {}

std::optional<std::string> StunLocalAddressInferrer::inferLocalAddress() {
    auto state = std::make_shared<Negotiation>();
    auto deadline = steady_clock::now() + m_timeout;

    // The worker owns only copies and the shared state, so it may outlive
    // this call when name resolution is slow.
    try {
        std::thread([state, host = m_host, port = m_port, deadline, verbose = m_verbose]() {
            try {
                negotiate(state, host, port, deadline, verbose);
            } catch (const std::exception& e) {
                std::cerr << "[LocalAddress] Negotiation error: " << e.what() << std::endl;
                state->finish(std::nullopt);
            }
        }).detach();
    } catch (const std::system_error& e) {
        std::cerr << "[LocalAddress] Cannot start negotiation: " << e.what() << std::endl;
        return std::nullopt;
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    if (!state->cv.wait_until(lock, deadline, [&] { return state->done; })) {
        state->abandoned = true;
        std::cout << "[LocalAddress] No local address within " << m_timeout.count() << " ms" << std::endl;
        return std::nullopt;
    }
    if (state->result) std::cout << "[LocalAddress] Local address " << *state->result << std::endl;
    return state->result;
}

namespace Stun {

bool randomTransactionId(TransactionId& id) {
    return RAND_bytes(id.data(), static_cast<int>(id.size())) == 1;
}

std::vector<std::uint8_t> buildBindingRequest(const TransactionId& id) {
    std::vector<std::uint8_t> msg;
    msg.reserve(20);
    msg.push_back(static_cast<std::uint8_t>(kBindingRequest >> 8));
    msg.push_back(static_cast<std::uint8_t>(kBindingRequest & 0xFF));
    msg.push_back(0);   // attribute length
    msg.push_back(0);
    for (int shift = 24; shift >= 0; shift -= 8) {
        msg.push_back(static_cast<std::uint8_t>((kMagicCookie >> shift) & 0xFF));
    }
    msg.insert(msg.end(), id.begin(), id.end());
    return msg;
}

std::optional<std::string> parseBindingResponse(const std::vector<std::uint8_t>& packet, const TransactionId& id) {
    if (packet.size() < 20) return std::nullopt;
    if (read16(packet, 0) != kBindingSuccess) return std::nullopt;
    if (read32(packet, 4) != kMagicCookie) return std::nullopt;
    if (!std::equal(id.begin(), id.end(), packet.begin() + 8)) return std::nullopt;

    size_t bodyLen = read16(packet, 2);
    size_t end = std::min(packet.size(), 20 + bodyLen);

    std::optional<std::string> mapped;
    size_t off = 20;
    while (off + 4 <= end) {
        std::uint16_t type = read16(packet, off);
        std::uint16_t len = read16(packet, off + 2);
        size_t value = off + 4;
        if (value + len > end) break;

        // value: reserved(1) family(1) port(2) address(4)
        if ((type == kAttrXorMappedAddress || type == kAttrMappedAddress) && len >= 8 && packet[value + 1] == 0x01) {
            std::uint32_t addr = read32(packet, value + 4);
            if (type == kAttrXorMappedAddress) return ipv4ToString(addr ^ kMagicCookie);
            if (!mapped) mapped = ipv4ToString(addr);
        }
        off = value + ((len + 3u) & ~3u);
    }
    return mapped;
}

} // namespace Stun

} // namespace Elixir
