#include "controllers/DiscoveryController.h"

#include "api_json.h"
#include "controllers/Responses.h"
#include "device_registry.h"
#include "discovery_engine.h"

#include <drogon/drogon.h>

#include <chrono>

namespace bacproxy {

namespace {

Result<ScanOptions> scanOptions(const drogon::HttpRequestPtr &req, bool resolveByDefault) {
    ScanOptions options;
    auto window = uintParam(req, "window_ms", ErrorKind::InvalidScanTarget);
    if (!window) {
        return window.error();
    }
    if (window.value()) {
        options.window = std::chrono::milliseconds(*window.value());
    }
    options.resolveNames = resolveByDefault;
    if (const auto text = queryParam(req, "resolve_names")) {
        const auto flag = api::parseBool(*text);
        if (!flag) {
            return makeError(ErrorKind::InvalidRequest, "resolve_names must be a boolean, got '" + *text + "'");
        }
        options.resolveNames = *flag;
    }
    return options;
}

Json::Value devicesToJson(const std::vector<DeviceAnnouncement> &devices) {
    Json::Value list(Json::arrayValue);
    for (const auto &device : devices) {
        list.append(api::announcementToJson(device));
    }
    return list;
}

void runNetworkScan(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &callback,
                    const std::string &networkParam) {
    const auto network = queryParam(req, networkParam);
    if (!network) {
        callback(errorResponse(req, makeError(ErrorKind::InvalidScanTarget, networkParam + " is required")));
        return;
    }
    auto options = scanOptions(req, true);
    if (!options) {
        callback(errorResponse(req, options.error()));
        return;
    }

    runEngineTask([req, callback = std::move(callback), target = *network, scan = options.value()]() {
        auto found = DiscoveryEngine::instance().scanRange(ScanTarget::forNetwork(target), scan);
        if (!found) {
            callback(errorResponse(req, found.error()));
            return;
        }
        Json::Value body;
        body["scanned_ip_target"] = target;
        body["devices"] = devicesToJson(found.value());
        callback(doneResponse(body));
    });
}

} // namespace

void DiscoveryController::scan(const drogon::HttpRequestPtr &req,
                               std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
    runNetworkScan(req, callback, "network");
}

void DiscoveryController::legacyScan(const drogon::HttpRequestPtr &req,
                                     std::function<void(const drogon::HttpResponsePtr &)> &&callback,
                                     const std::string &tool) {
    if (tool != "bacnet") {
        callback(errorResponse(req, makeError(ErrorKind::InvalidRequest, "unsupported tool '" + tool + "'")));
        return;
    }
    runNetworkScan(req, callback, "ip_address");
}

void DiscoveryController::whoIs(const drogon::HttpRequestPtr &req,
                                std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
    auto low = uintParam(req, "low", ErrorKind::InvalidScanTarget);
    if (!low) {
        callback(errorResponse(req, low.error()));
        return;
    }
    auto high = uintParam(req, "high", ErrorKind::InvalidScanTarget);
    if (!high) {
        callback(errorResponse(req, high.error()));
        return;
    }
    auto options = scanOptions(req, false);
    if (!options) {
        callback(errorResponse(req, options.error()));
        return;
    }

    runEngineTask([req, callback = std::move(callback), low = low.value(), high = high.value(),
                   destination = queryParam(req, "destination"), scan = options.value()]() {
        auto found = DiscoveryEngine::instance().whoIs(low, high, destination, scan);
        if (!found) {
            callback(errorResponse(req, found.error()));
            return;
        }
        Json::Value body;
        body["devices"] = devicesToJson(found.value());
        callback(doneResponse(body));
    });
}

void DiscoveryController::devices(const drogon::HttpRequestPtr &,
                                  std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
    const auto &registry = DeviceRegistry::instance();
    Json::Value body;
    body["scanned_ip_target"] = registry.lastScanTarget();
    if (const auto when = registry.lastScanTime()) {
        body["scanned_at_ms"] = static_cast<Json::Int64>(
            std::chrono::duration_cast<std::chrono::milliseconds>(when->time_since_epoch()).count());
    }
    body["devices"] = devicesToJson(registry.list());
    callback(doneResponse(body));
}

} // namespace bacproxy
