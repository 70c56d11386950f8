#include "controllers/ProxyController.h"

#include "api_json.h"
#include "bacnet_proxy.h"
#include "controllers/Responses.h"
#include "device_registry.h"

#include <drogon/drogon.h>

namespace bacproxy {

void ProxyController::start(const drogon::HttpRequestPtr &req,
                            std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
    auto address = queryParam(req, "address");
    if (!address) {
        if (const auto json = req->getJsonObject(); json && (*json)["address"].isString() &&
                                                    !(*json)["address"].asString().empty()) {
            address = (*json)["address"].asString();
        }
    }

    auto &proxy = BacnetProxy::instance();
    auto started = proxy.start(address);
    if (!started) {
        callback(errorResponse(req, started.error()));
        return;
    }

    Json::Value body;
    body["address"] = started.value();
    body["port"] = static_cast<Json::UInt>(proxy.status().port);
    callback(doneResponse(body));
}

void ProxyController::stop(const drogon::HttpRequestPtr &,
                           std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
    BacnetProxy::instance().stop();
    DeviceRegistry::instance().clear();
    callback(doneResponse());
}

void ProxyController::status(const drogon::HttpRequestPtr &,
                             std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
    auto body = api::statusToJson(BacnetProxy::instance().status());
    body["known_devices"] = static_cast<Json::UInt64>(DeviceRegistry::instance().size());
    callback(doneResponse(body));
}

} // namespace bacproxy
