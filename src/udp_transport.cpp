#include "udp_transport.h"

#include "address_resolver.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace bacproxy {

namespace {

constexpr std::size_t kReceiveBufferSize = 2048;

std::string osError(const std::string &context) {
    return context + ": " + std::strerror(errno);
}

} // namespace

UdpTransport::UdpTransport(int fd, Ipv4Endpoint local) : fd(fd), local(local) {}

UdpTransport::~UdpTransport() {
    close();
}

Result<std::shared_ptr<Transport>> UdpTransport::open(const TransportOptions &options) {
    const int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        return makeError(ErrorKind::BindError, osError("socket() failed"));
    }

    const int enable = 1;
    if (::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) != 0 ||
        ::setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) != 0) {
        auto error = makeError(ErrorKind::BindError, osError("setsockopt() failed"));
        ::close(sock);
        return error;
    }

    sockaddr_in bindAddr{};
    bindAddr.sin_family = AF_INET;
    bindAddr.sin_port = htons(options.port);
    bindAddr.sin_addr.s_addr = options.bindWildcard ? htonl(INADDR_ANY) : htonl(options.address);
    if (::bind(sock, reinterpret_cast<sockaddr *>(&bindAddr), sizeof(bindAddr)) != 0) {
        auto error = makeError(ErrorKind::BindError,
                               osError("bind(" + formatIp(options.address) + ":" + std::to_string(options.port) + ") failed"));
        ::close(sock);
        return error;
    }

    sockaddr_in boundAddr{};
    socklen_t len = sizeof(boundAddr);
    std::uint16_t boundPort = options.port;
    if (::getsockname(sock, reinterpret_cast<sockaddr *>(&boundAddr), &len) == 0) {
        boundPort = ntohs(boundAddr.sin_port);
    }

    std::cout << "[BACnet] UDP socket bound on "
              << (options.bindWildcard ? std::string("0.0.0.0") : formatIp(options.address)) << ":" << boundPort
              << " (advertising " << formatIp(options.address) << ")" << std::endl;
    return std::shared_ptr<Transport>(new UdpTransport(sock, Ipv4Endpoint{options.address, boundPort}));
}

Result<Acknowledged> UdpTransport::send(const Ipv4Endpoint &destination, const std::vector<std::uint8_t> &frame) {
    const int sock = fd.load();
    if (sock < 0) {
        return makeError(ErrorKind::TransportError, "socket is closed");
    }
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(destination.port);
    dest.sin_addr.s_addr = htonl(destination.ip);
    const auto sent = ::sendto(sock, frame.data(), frame.size(), 0, reinterpret_cast<sockaddr *>(&dest), sizeof(dest));
    if (sent < 0 || static_cast<std::size_t>(sent) != frame.size()) {
        return makeError(ErrorKind::TransportError, osError("sendto(" + formatDeviceAddress(destination) + ") failed"));
    }
    return Acknowledged{};
}

std::optional<Datagram> UdpTransport::receive(std::chrono::milliseconds timeout) {
    const int sock = fd.load();
    if (sock < 0) {
        return std::nullopt;
    }

    fd_set readFds;
    FD_ZERO(&readFds);
    FD_SET(sock, &readFds);
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    const int rv = ::select(sock + 1, &readFds, nullptr, nullptr, &tv);
    if (rv < 0) {
        if (errno != EINTR) {
            std::cerr << "[BACnet] select() failed: " << std::strerror(errno) << std::endl;
        }
        return std::nullopt;
    }
    if (rv == 0 || !FD_ISSET(sock, &readFds)) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> buffer(kReceiveBufferSize);
    sockaddr_in from{};
    socklen_t fromLen = sizeof(from);
    const auto received =
        ::recvfrom(sock, buffer.data(), buffer.size(), 0, reinterpret_cast<sockaddr *>(&from), &fromLen);
    if (received <= 0) {
        if (received < 0 && errno != EINTR && errno != EAGAIN) {
            std::cerr << "[BACnet] recvfrom() failed: " << std::strerror(errno) << std::endl;
        }
        return std::nullopt;
    }
    buffer.resize(static_cast<std::size_t>(received));

    Datagram datagram;
    datagram.source.ip = static_cast<std::uint32_t>(ntohl(from.sin_addr.s_addr));
    datagram.source.port = ntohs(from.sin_port);
    // Our own broadcasts loop back on a wildcard socket.
    if (datagram.source == local) {
        return std::nullopt;
    }
    datagram.payload = std::move(buffer);
    return datagram;
}

void UdpTransport::close() {
    const int sock = fd.exchange(-1);
    if (sock >= 0) {
        ::close(sock);
    }
}

TransportFactory udpTransportFactory() {
    return [](const TransportOptions &options) { return UdpTransport::open(options); };
}

} // namespace bacproxy
