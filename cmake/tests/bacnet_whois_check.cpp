#include "address_resolver.h"
#include "bacnet_codec.h"
#include "udp_transport.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

// Manual check: broadcasts one Who-Is from a local address and prints every
// I-Am heard before the window closes.
int main(int argc, char **argv)
{
    using namespace bacproxy;

    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <local-ip> [destination-ip] [window-ms] [port]" << std::endl;
        return 1;
    }

    const auto localIp = parseIp(argv[1]);
    const auto destIp = parseIp(argc > 2 ? argv[2] : "255.255.255.255");
    const auto windowMs = argc > 3 ? std::stoul(argv[3]) : 3000UL;
    const auto port = static_cast<std::uint16_t>(argc > 4 ? std::stoul(argv[4]) : kDefaultBacnetPort);

    if (!localIp || !destIp)
    {
        std::cerr << "Invalid IPv4 argument; ensure dotted-quad notation is used." << std::endl;
        return 1;
    }
    if (!ipAssignedToLocalInterface(*localIp))
    {
        std::cerr << "Local IP " << formatIp(*localIp)
                  << " is not configured on this host. Choose a local interface address." << std::endl;
        return 1;
    }

    TransportOptions options;
    options.address = *localIp;
    options.port = port;
    auto transport = UdpTransport::open(options);
    if (!transport)
    {
        std::cerr << "Opening UDP port failed: " << transport.error().describe() << std::endl;
        return 1;
    }

    const Ipv4Endpoint destination{*destIp, port};
    const bool broadcast = (*destIp & 0xFFU) == 0xFFU;
    auto sent = transport.value()->send(destination, codec::encodeWhoIs(std::nullopt, broadcast));
    if (!sent)
    {
        std::cerr << "Who-Is send failed: " << sent.error().describe() << std::endl;
        return 2;
    }
    std::cout << "Who-Is sent to " << formatDeviceAddress(destination) << ", listening for " << windowMs << " ms"
              << std::endl;

    std::size_t heard = 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(windowMs);
    while (std::chrono::steady_clock::now() < deadline)
    {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        auto datagram = transport.value()->receive(remaining);
        if (!datagram)
        {
            continue;
        }
        auto decoded = codec::decodeFrame(datagram->payload.data(), datagram->payload.size());
        if (!decoded)
        {
            continue;
        }
        if (const auto *iam = std::get_if<codec::IAm>(&decoded->message))
        {
            ++heard;
            std::cout << "I-Am device " << iam->deviceInstance << " from "
                      << formatDeviceAddress(decoded->originator.value_or(datagram->source)) << " vendor "
                      << iam->vendorId << " max-apdu " << iam->maxApdu << std::endl;
        }
    }

    transport.value()->close();
    std::cout << heard << " device(s) answered." << std::endl;
    return 0;
}
