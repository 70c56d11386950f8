#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bacproxy {

// All addresses are IPv4 in host byte order.

std::string formatIp(std::uint32_t ip);
std::optional<std::uint32_t> parseIp(const std::string &text);

struct Ipv4Network {
    std::uint32_t address{0};
    std::uint8_t prefixLength{32};

    [[nodiscard]] std::uint32_t mask() const noexcept;
    [[nodiscard]] std::uint32_t networkAddress() const noexcept { return address & mask(); }
    [[nodiscard]] std::uint32_t broadcastAddress() const noexcept { return networkAddress() | ~mask(); }
    [[nodiscard]] bool contains(std::uint32_t ip) const noexcept { return (ip & mask()) == networkAddress(); }
    [[nodiscard]] std::string describe() const;
};

// Accepts "a.b.c.d/nn" or a bare "a.b.c.d" (treated as /32).
std::optional<Ipv4Network> parseCidr(const std::string &text);

// Address a Who-Is for this block is sent to: the directed broadcast, or the
// host itself for /31 and /32 blocks.
std::uint32_t discoveryAddressFor(const Ipv4Network &network);

struct InterfaceAddress {
    std::uint32_t ip{0};
    std::uint32_t netmask{0};
    std::string interfaceName;

    [[nodiscard]] std::uint8_t prefixLength() const noexcept;
    [[nodiscard]] std::string cidr() const;
};

bool ipAssignedToLocalInterface(std::uint32_t ip);
std::optional<InterfaceAddress> findLocalInterface(std::uint32_t ip);
std::optional<InterfaceAddress> resolveInterfaceByName(const std::string &ifName);

// Local interface the kernel would route traffic to `targetIp` through.
// No packet is sent: a UDP socket is connected and its local name queried.
std::optional<InterfaceAddress> localIpFor(const std::string &targetIp);

} // namespace bacproxy
