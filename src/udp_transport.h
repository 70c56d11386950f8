#pragma once

#include "bacnet_types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace bacproxy {

struct Datagram {
    Ipv4Endpoint source;
    std::vector<std::uint8_t> payload;
};

struct TransportOptions {
    std::uint32_t address{0}; // local interface the proxy advertises
    std::uint16_t port{kDefaultBacnetPort};
    // Bind INADDR_ANY so directed and global broadcasts are delivered too.
    bool bindWildcard{true};
};

/**
 * Datagram transport owned by the proxy.
 *
 * receive() is only ever called from the proxy worker thread; send() may be
 * called concurrently from any caller thread.
 */
class Transport {
  public:
    virtual ~Transport() = default;

    virtual Result<Acknowledged> send(const Ipv4Endpoint &destination, const std::vector<std::uint8_t> &frame) = 0;
    // Blocks for at most `timeout`; nullopt when nothing arrived.
    virtual std::optional<Datagram> receive(std::chrono::milliseconds timeout) = 0;
    [[nodiscard]] virtual Ipv4Endpoint localEndpoint() const = 0;
    virtual void close() = 0;
};

using TransportFactory = std::function<Result<std::shared_ptr<Transport>>(const TransportOptions &)>;

class UdpTransport : public Transport {
  public:
    static Result<std::shared_ptr<Transport>> open(const TransportOptions &options);

    ~UdpTransport() override;

    UdpTransport(const UdpTransport &) = delete;
    UdpTransport &operator=(const UdpTransport &) = delete;

    Result<Acknowledged> send(const Ipv4Endpoint &destination, const std::vector<std::uint8_t> &frame) override;
    std::optional<Datagram> receive(std::chrono::milliseconds timeout) override;
    [[nodiscard]] Ipv4Endpoint localEndpoint() const override { return local; }
    void close() override;

  private:
    UdpTransport(int fd, Ipv4Endpoint local);

    std::atomic<int> fd{-1};
    Ipv4Endpoint local;
};

TransportFactory udpTransportFactory();

} // namespace bacproxy
