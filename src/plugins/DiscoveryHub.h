#pragma once

#include "bacnet_types.h"
#include "discovery_engine.h"

#include <drogon/WebSocketConnection.h>
#include <drogon/plugins/Plugin.h>

#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace bacproxy {

// Fans discovery events out to every /ws/discovery subscriber.
class DiscoveryHub : public drogon::Plugin<DiscoveryHub> {
  public:
    DiscoveryHub();

    void initAndStart(const Json::Value &config) override;
    void shutdown() override;

    void subscribe(const drogon::WebSocketConnectionPtr &conn);
    void unsubscribe(const drogon::WebSocketConnectionPtr &conn);

    void publishScanStarted(const std::string &target);
    void publishAnnouncement(const DeviceAnnouncement &announcement);
    void publishScanFinished(const std::string &target, std::size_t deviceCount);

    // Proxy status plus the devices of the last scan.
    void sendSnapshot(const drogon::WebSocketConnectionPtr &conn);

    static DiscoveryHub *instance();

  private:
    void broadcast(const Json::Value &payload);

    std::shared_ptr<DiscoveryObserver> observer;
    std::mutex connMtx;
    std::set<drogon::WebSocketConnectionPtr> connections;
};

} // namespace bacproxy
