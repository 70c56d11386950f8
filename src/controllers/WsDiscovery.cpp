#include "controllers/WsDiscovery.h"

#include "plugins/DiscoveryHub.h"

namespace bacproxy {

void WsDiscovery::handleNewConnection(const drogon::HttpRequestPtr &, const drogon::WebSocketConnectionPtr &conn) {
    if (auto *hub = DiscoveryHub::instance()) {
        hub->subscribe(conn);
    }
}

void WsDiscovery::handleConnectionClosed(const drogon::WebSocketConnectionPtr &conn) {
    if (auto *hub = DiscoveryHub::instance()) {
        hub->unsubscribe(conn);
    }
}

void WsDiscovery::handleNewMessage(const drogon::WebSocketConnectionPtr &conn, std::string &&,
                                   const drogon::WebSocketMessageType &type) {
    // Push-only feed; any text frame asks for a fresh snapshot.
    if (type != drogon::WebSocketMessageType::Text) {
        return;
    }
    if (auto *hub = DiscoveryHub::instance()) {
        hub->sendSnapshot(conn);
    }
}

} // namespace bacproxy
