#include "address_resolver.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <iostream>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace bacproxy {

namespace {

template <typename Predicate> std::optional<InterfaceAddress> scanInterfaces(Predicate &&matches) {
    ifaddrs *ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0 || ifaddr == nullptr) {
        return std::nullopt;
    }

    std::optional<InterfaceAddress> found;
    for (auto *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        const auto *addr = reinterpret_cast<sockaddr_in *>(ifa->ifa_addr);
        InterfaceAddress candidate;
        candidate.ip = static_cast<std::uint32_t>(ntohl(addr->sin_addr.s_addr));
        if (ifa->ifa_netmask != nullptr) {
            const auto *mask = reinterpret_cast<sockaddr_in *>(ifa->ifa_netmask);
            candidate.netmask = static_cast<std::uint32_t>(ntohl(mask->sin_addr.s_addr));
        }
        if (ifa->ifa_name != nullptr) {
            candidate.interfaceName = ifa->ifa_name;
        }
        if (matches(candidate)) {
            found = candidate;
            break;
        }
    }

    freeifaddrs(ifaddr);
    return found;
}

} // namespace

std::string formatIp(std::uint32_t ip) {
    in_addr addr{};
    addr.s_addr = htonl(ip);
    char buffer[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) {
        return "<invalid IPv4>";
    }
    return buffer;
}

std::optional<std::uint32_t> parseIp(const std::string &text) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(ntohl(addr.s_addr));
}

std::uint32_t Ipv4Network::mask() const noexcept {
    if (prefixLength == 0) {
        return 0U;
    }
    return prefixLength >= 32 ? 0xFFFFFFFFU : ~((1U << (32U - prefixLength)) - 1U);
}

std::string Ipv4Network::describe() const {
    return formatIp(networkAddress()) + "/" + std::to_string(prefixLength);
}

std::optional<Ipv4Network> parseCidr(const std::string &text) {
    Ipv4Network network;
    std::string host = text;
    if (const auto slash = text.find('/'); slash != std::string::npos) {
        host = text.substr(0, slash);
        const auto prefixText = text.substr(slash + 1);
        if (prefixText.empty() || prefixText.size() > 2 ||
            prefixText.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        const auto prefix = std::stoul(prefixText);
        if (prefix > 32U) {
            return std::nullopt;
        }
        network.prefixLength = static_cast<std::uint8_t>(prefix);
    }
    const auto ip = parseIp(host);
    if (!ip) {
        return std::nullopt;
    }
    network.address = *ip;
    return network;
}

std::uint32_t discoveryAddressFor(const Ipv4Network &network) {
    if (network.prefixLength >= 31) {
        return network.address;
    }
    return network.broadcastAddress();
}

std::uint8_t InterfaceAddress::prefixLength() const noexcept {
    std::uint8_t bits = 0;
    for (std::uint32_t m = netmask; m != 0U; m <<= 1U) {
        if ((m & 0x80000000U) == 0U) {
            break;
        }
        ++bits;
    }
    return bits;
}

std::string InterfaceAddress::cidr() const {
    Ipv4Network network{ip, prefixLength()};
    return network.describe();
}

bool ipAssignedToLocalInterface(std::uint32_t ip) {
    if (ip == 0U) {
        return true;
    }
    return findLocalInterface(ip).has_value();
}

std::optional<InterfaceAddress> findLocalInterface(std::uint32_t ip) {
    return scanInterfaces([ip](const InterfaceAddress &candidate) { return candidate.ip == ip; });
}

std::optional<InterfaceAddress> resolveInterfaceByName(const std::string &ifName) {
    if (ifName.empty()) {
        return std::nullopt;
    }
    return scanInterfaces([&ifName](const InterfaceAddress &candidate) { return candidate.interfaceName == ifName; });
}

std::optional<InterfaceAddress> localIpFor(const std::string &targetIp) {
    const auto target = parseIp(targetIp);
    if (!target) {
        std::cerr << "[BACnet] Resolver target '" << targetIp << "' is not an IPv4 address" << std::endl;
        return std::nullopt;
    }

    const int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        return std::nullopt;
    }

    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_addr.s_addr = htonl(*target);
    remote.sin_port = htons(80);

    std::optional<std::uint32_t> localIp;
    if (::connect(sock, reinterpret_cast<sockaddr *>(&remote), sizeof(remote)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (::getsockname(sock, reinterpret_cast<sockaddr *>(&local), &len) == 0) {
            localIp = static_cast<std::uint32_t>(ntohl(local.sin_addr.s_addr));
        }
    }
    ::close(sock);

    if (!localIp || *localIp == 0U) {
        std::cerr << "[BACnet] No route towards " << targetIp << "; unable to pick a local address" << std::endl;
        return std::nullopt;
    }

    if (auto iface = findLocalInterface(*localIp)) {
        return iface;
    }
    InterfaceAddress fallback;
    fallback.ip = *localIp;
    fallback.netmask = 0xFFFFFF00U;
    return fallback;
}

} // namespace bacproxy
