#include "bacnet_proxy.h"

#include "address_resolver.h"

#include <iostream>
#include <type_traits>

namespace bacproxy {

ProxySession::ProxySession(std::shared_ptr<Transport> transport, ProxyConfig config)
    : link(std::move(transport)), cfg(std::move(config)) {}

Result<Acknowledged> ProxySession::send(const Ipv4Endpoint &destination, const codec::Frame &frame) {
    if (frame.empty()) {
        return makeError(ErrorKind::InvalidRequest, "request could not be encoded");
    }
    if (stopRequested()) {
        return makeError(ErrorKind::ProxyStopped, "proxy is shutting down");
    }
    return link->send(destination, frame);
}

BacnetProxy &BacnetProxy::instance() {
    static BacnetProxy proxy;
    return proxy;
}

BacnetProxy::BacnetProxy(ProxyConfig config, TransportFactory factory)
    : factory(std::move(factory)), pendingConfig(std::move(config)) {}

BacnetProxy::~BacnetProxy() {
    stop();
}

void BacnetProxy::configure(const ProxyConfig &config) {
    std::lock_guard lock(stateMtx);
    pendingConfig = config;
}

ProxyConfig BacnetProxy::configuration() const {
    std::lock_guard lock(stateMtx);
    return pendingConfig;
}

Result<std::uint32_t> BacnetProxy::resolveBindAddress(const std::optional<std::string> &requested,
                                                      const ProxyConfig &cfg) const {
    auto address = requested;
    if ((!address || address->empty()) && !cfg.bindAddress.empty()) {
        address = cfg.bindAddress;
    }
    if (address && !address->empty()) {
        const auto ip = parseIp(*address);
        if (!ip) {
            return makeError(ErrorKind::BindError, "'" + *address + "' is not a dotted-quad IPv4 address");
        }
        if (*ip == 0U) {
            return makeError(ErrorKind::BindError, "0.0.0.0 names no interface; omit the address to pick one");
        }
        if (!ipAssignedToLocalInterface(*ip)) {
            return makeError(ErrorKind::BindError, *address + " is not assigned to any local interface");
        }
        return *ip;
    }
    if (!cfg.interfaceName.empty()) {
        if (const auto iface = resolveInterfaceByName(cfg.interfaceName)) {
            return iface->ip;
        }
        return makeError(ErrorKind::BindError, "interface '" + cfg.interfaceName + "' has no IPv4 address");
    }
    if (const auto iface = localIpFor(cfg.resolverTarget)) {
        return iface->ip;
    }
    return makeError(ErrorKind::BindError, "unable to determine a local address (resolver target " +
                                               cfg.resolverTarget + ")");
}

Result<std::string> BacnetProxy::start(const std::optional<std::string> &address) {
    std::lock_guard lifecycle(lifecycleMtx);
    ProxyConfig cfg;
    {
        std::lock_guard lock(stateMtx);
        if (active) {
            return makeError(ErrorKind::AlreadyRunning,
                             "proxy already running on " + formatIp(active->localEndpoint().ip));
        }
        cfg = pendingConfig;
    }

    auto bindIp = resolveBindAddress(address, cfg);
    if (!bindIp) {
        std::cerr << "[BACnet] Start failed: " << bindIp.error().message << std::endl;
        return bindIp.error();
    }

    TransportOptions options;
    options.address = bindIp.value();
    options.port = cfg.port;
    options.bindWildcard = cfg.bindWildcard;
    auto transport = factory(options);
    if (!transport) {
        std::cerr << "[BACnet] Start failed: " << transport.error().message << std::endl;
        return transport.error();
    }

    auto session = std::make_shared<ProxySession>(transport.value(), cfg);
    {
        std::lock_guard lock(stateMtx);
        active = session;
    }
    worker = std::thread([this, session]() { processingLoop(session); });

    const auto local = session->localEndpoint();
    std::cout << "[BACnet] Proxy started on " << formatIp(local.ip) << ":" << local.port << std::endl;
    return formatIp(local.ip);
}

void BacnetProxy::stop() {
    std::lock_guard lifecycle(lifecycleMtx);
    std::shared_ptr<ProxySession> session;
    {
        std::lock_guard lock(stateMtx);
        session = std::move(active);
        active.reset();
    }
    if (!session) {
        return;
    }

    session->requestStop();
    session->exchanges().close();
    if (worker.joinable()) {
        worker.join();
    }
    session->transport().close();
    std::cout << "[BACnet] Proxy stopped" << std::endl;
}

bool BacnetProxy::isRunning() const {
    std::lock_guard lock(stateMtx);
    return active != nullptr;
}

ProxyStatus BacnetProxy::status() const {
    std::shared_ptr<ProxySession> session;
    {
        std::lock_guard lock(stateMtx);
        session = active;
    }
    ProxyStatus status;
    if (!session) {
        return status;
    }
    const auto local = session->localEndpoint();
    status.running = true;
    status.address = formatIp(local.ip);
    status.port = local.port;
    status.pendingExchanges = session->exchanges().pendingCount();
    status.scanInProgress = session->scanInProgress();
    return status;
}

Result<std::shared_ptr<ProxySession>> BacnetProxy::session() const {
    std::lock_guard lock(stateMtx);
    if (!active) {
        return makeError(ErrorKind::ProxyNotRunning, "proxy is not running; call start first");
    }
    return active;
}

void BacnetProxy::processingLoop(std::shared_ptr<ProxySession> session) {
    std::cout << "[BACnet] Worker thread started" << std::endl;
    const auto interval = session->config().idleInterval;
    while (!session->stopRequested()) {
        auto datagram = session->transport().receive(interval);
        if (!datagram || session->stopRequested()) {
            continue;
        }
        dispatch(*session, *datagram);
    }
    std::cout << "[BACnet] Worker thread exiting" << std::endl;
}

void BacnetProxy::dispatch(ProxySession &session, const Datagram &datagram) {
    auto decoded = codec::decodeFrame(datagram.payload.data(), datagram.payload.size());
    if (!decoded) {
        std::cout << "[BACnet] Dropped " << datagram.payload.size() << "-byte frame from "
                  << formatDeviceAddress(datagram.source) << " (not a supported BACnet/IP message)" << std::endl;
        return;
    }
    const auto source = decoded->originator.value_or(datagram.source);

    std::visit(
        [&](const auto &message) {
            using M = std::decay_t<decltype(message)>;
            if constexpr (std::is_same_v<M, codec::IAm>) {
                session.exchanges().announce(source, message);
            } else if constexpr (std::is_same_v<M, codec::WhoIs> || std::is_same_v<M, codec::ReadPropertyRequest> ||
                                 std::is_same_v<M, codec::WritePropertyRequest>) {
                // This endpoint is a client only; requests from peers are ignored.
            } else {
                if (!session.exchanges().deliver(source, decoded->message)) {
                    std::cout << "[BACnet] Dropped unmatched reply from " << formatDeviceAddress(source)
                              << " (invoke id " << static_cast<unsigned>(message.invokeId) << ")" << std::endl;
                }
            }
        },
        decoded->message);
}

} // namespace bacproxy
