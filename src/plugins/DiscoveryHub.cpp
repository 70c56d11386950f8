#include "plugins/DiscoveryHub.h"

#include "api_json.h"
#include "bacnet_proxy.h"
#include "device_registry.h"

#include <drogon/drogon.h>

namespace bacproxy {

namespace {
DiscoveryHub *g_instance = nullptr;

class HubObserver : public DiscoveryObserver {
  public:
    explicit HubObserver(DiscoveryHub &hub) : hub(hub) {}

    void onScanStarted(const std::string &target) override { hub.publishScanStarted(target); }
    void onDeviceAnnounced(const DeviceAnnouncement &announcement) override { hub.publishAnnouncement(announcement); }
    void onScanFinished(const std::string &target, std::size_t deviceCount) override {
        hub.publishScanFinished(target, deviceCount);
    }

  private:
    DiscoveryHub &hub;
};
} // namespace

DiscoveryHub::DiscoveryHub() = default;

void DiscoveryHub::initAndStart(const Json::Value &) {
    g_instance = this;
    observer = std::make_shared<HubObserver>(*this);
    DiscoveryEngine::instance().addObserver(observer);
}

void DiscoveryHub::shutdown() {
    DiscoveryEngine::instance().removeObserver(observer);
    observer.reset();
    {
        std::lock_guard lock(connMtx);
        connections.clear();
    }
    BacnetProxy::instance().stop();
    g_instance = nullptr;
}

DiscoveryHub *DiscoveryHub::instance() { return g_instance; }

void DiscoveryHub::subscribe(const drogon::WebSocketConnectionPtr &conn) {
    {
        std::lock_guard lock(connMtx);
        connections.insert(conn);
    }
    sendSnapshot(conn);
}

void DiscoveryHub::unsubscribe(const drogon::WebSocketConnectionPtr &conn) {
    std::lock_guard lock(connMtx);
    connections.erase(conn);
}

void DiscoveryHub::publishScanStarted(const std::string &target) {
    Json::Value payload;
    payload["type"] = "scan_started";
    payload["target"] = target;
    broadcast(payload);
}

void DiscoveryHub::publishAnnouncement(const DeviceAnnouncement &announcement) {
    Json::Value payload;
    payload["type"] = "iam";
    payload["device"] = api::announcementToJson(announcement);
    broadcast(payload);
}

void DiscoveryHub::publishScanFinished(const std::string &target, std::size_t deviceCount) {
    Json::Value payload;
    payload["type"] = "scan_finished";
    payload["target"] = target;
    payload["device_count"] = static_cast<Json::UInt64>(deviceCount);
    broadcast(payload);
}

void DiscoveryHub::sendSnapshot(const drogon::WebSocketConnectionPtr &conn) {
    Json::Value payload;
    payload["type"] = "snapshot";
    payload["proxy"] = api::statusToJson(BacnetProxy::instance().status());
    payload["scanned_ip_target"] = DeviceRegistry::instance().lastScanTarget();
    auto &devices = payload["devices"];
    devices = Json::Value(Json::arrayValue);
    for (const auto &device : DeviceRegistry::instance().list()) {
        devices.append(api::announcementToJson(device));
    }
    conn->send(payload.toStyledString());
}

void DiscoveryHub::broadcast(const Json::Value &payload) {
    const auto message = payload.toStyledString();
    std::lock_guard lock(connMtx);
    for (auto it = connections.begin(); it != connections.end();) {
        if ((*it)->connected()) {
            (*it)->send(message);
            ++it;
        } else {
            it = connections.erase(it);
        }
    }
}

} // namespace bacproxy
