#pragma once

#include "bacnet_codec.h"
#include "bacnet_types.h"
#include "exchange_table.h"
#include "udp_transport.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace bacproxy {

struct ProxyConfig {
    std::uint16_t port{kDefaultBacnetPort};
    bool bindWildcard{true};
    // Used when start() gets no address.
    std::string bindAddress;
    // Interface used when neither is set; empty means "ask the router".
    std::string interfaceName;
    std::string resolverTarget{"8.8.8.8"};
    // How long the worker blocks in receive before re-checking for stop.
    std::chrono::milliseconds idleInterval{std::chrono::milliseconds(50)};
    std::chrono::milliseconds apduTimeout{std::chrono::milliseconds(3000)};
    unsigned apduRetries{0};
    std::chrono::milliseconds scanWindow{std::chrono::milliseconds(3000)};
};

// One started endpoint. Lives from start() until stop() and the last caller
// holding it returns.
class ProxySession {
  public:
    ProxySession(std::shared_ptr<Transport> transport, ProxyConfig config);

    ProxySession(const ProxySession &) = delete;
    ProxySession &operator=(const ProxySession &) = delete;

    Result<Acknowledged> send(const Ipv4Endpoint &destination, const codec::Frame &frame);

    [[nodiscard]] Transport &transport() noexcept { return *link; }
    [[nodiscard]] ExchangeTable &exchanges() noexcept { return table; }
    [[nodiscard]] const ProxyConfig &config() const noexcept { return cfg; }
    [[nodiscard]] Ipv4Endpoint localEndpoint() const { return link->localEndpoint(); }
    // Held for the whole duration of a discovery window.
    [[nodiscard]] std::mutex &scanMutex() noexcept { return scanMtx; }
    [[nodiscard]] bool scanInProgress() const { return table.listenerAttached(); }

    [[nodiscard]] bool stopRequested() const noexcept { return stopFlag.load(); }
    void requestStop() noexcept { stopFlag.store(true); }

  private:
    std::shared_ptr<Transport> link;
    ProxyConfig cfg;
    ExchangeTable table;
    std::mutex scanMtx;
    std::atomic<bool> stopFlag{false};
};

/**
 * Process-wide BACnet/IP endpoint.
 *
 * Responsible for:
 *  - Resolving and binding the local address on start().
 *  - Running the background receive loop that routes replies and I-Am
 *    announcements into the exchange table.
 *  - Tearing everything down on stop(), releasing all waiters.
 *
 * Engines reach the live endpoint only through session().
 */
class BacnetProxy {
  public:
    static BacnetProxy &instance();

    explicit BacnetProxy(ProxyConfig config = {}, TransportFactory factory = udpTransportFactory());
    ~BacnetProxy();

    BacnetProxy(const BacnetProxy &) = delete;
    BacnetProxy &operator=(const BacnetProxy &) = delete;

    // Applies to the next start(); a running session keeps its settings.
    void configure(const ProxyConfig &config);
    [[nodiscard]] ProxyConfig configuration() const;

    // Returns the bound local address. AlreadyRunning if a session is live.
    Result<std::string> start(const std::optional<std::string> &address = std::nullopt);

    // Safe to call multiple times.
    void stop();

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] ProxyStatus status() const;

    // The live session, or ProxyNotRunning.
    Result<std::shared_ptr<ProxySession>> session() const;

  private:
    Result<std::uint32_t> resolveBindAddress(const std::optional<std::string> &requested, const ProxyConfig &cfg) const;
    void processingLoop(std::shared_ptr<ProxySession> session);
    void dispatch(ProxySession &session, const Datagram &datagram);

    TransportFactory factory;
    ProxyConfig pendingConfig;

    // Serialises start()/stop(); held while the worker is joined.
    std::mutex lifecycleMtx;
    mutable std::mutex stateMtx;
    std::shared_ptr<ProxySession> active;
    std::thread worker;
};

} // namespace bacproxy
