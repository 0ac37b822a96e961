// LocalAddressInferrer.hpp
// Best-guess private address of this machine, learned without privileged interface queries
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Elixir {

class LocalAddressInferrer {
public:
    virtual ~LocalAddressInferrer() = default;

    // Dotted IPv4 address, or nullopt when unknown. Never throws; bounded in time.
    virtual std::optional<std::string> inferLocalAddress() = 0;
};

// Runs a STUN Binding transaction against a public rendezvous service over a
// connected UDP socket and reports candidate addresses in negotiation order:
// the socket's locally assigned address first, then the address the server
// saw. The first one that is neither loopback nor link-local wins.
class StunLocalAddressInferrer : public LocalAddressInferrer {
public:
    StunLocalAddressInferrer(std::string rendezvousHost, int rendezvousPort,
                             std::chrono::milliseconds timeout, bool verbose = false);

    std::optional<std::string> inferLocalAddress() override;

private:
    std::string m_host;
    int m_port;
    std::chrono::milliseconds m_timeout;
    bool m_verbose;
};

// Usable as a local candidate: IPv4, not loopback, not link-local.
bool isUsableLocalCandidate(const std::string& address);

namespace Stun {

constexpr std::uint32_t kMagicCookie = 0x2112A442;
constexpr std::uint16_t kBindingRequest = 0x0001;
constexpr std::uint16_t kBindingSuccess = 0x0101;
constexpr std::uint16_t kAttrMappedAddress = 0x0001;
constexpr std::uint16_t kAttrXorMappedAddress = 0x0020;

using TransactionId = std::array<std::uint8_t, 12>;

// Fills id from a cryptographically secure source. False if none is available.
bool randomTransactionId(TransactionId& id);

std::vector<std::uint8_t> buildBindingRequest(const TransactionId& id);

// IPv4 reflexive address from a Binding success response matching id.
// Prefers XOR-MAPPED-ADDRESS over MAPPED-ADDRESS.
std::optional<std::string> parseBindingResponse(const std::vector<std::uint8_t>& packet, const TransactionId& id);

} // namespace Stun

} // namespace Elixir
