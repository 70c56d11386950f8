#pragma once

#include <drogon/WebSocketController.h>

namespace bacproxy {

class WsDiscovery : public drogon::WebSocketController<WsDiscovery> {
  public:
    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/ws/discovery", {"*"});
    WS_PATH_LIST_END

    void handleNewConnection(const drogon::HttpRequestPtr &req, const drogon::WebSocketConnectionPtr &conn) override;
    void handleConnectionClosed(const drogon::WebSocketConnectionPtr &conn) override;
    void handleNewMessage(const drogon::WebSocketConnectionPtr &conn, std::string &&message,
                          const drogon::WebSocketMessageType &type) override;
};

} // namespace bacproxy
