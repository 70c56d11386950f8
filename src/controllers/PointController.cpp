#include "controllers/PointController.h"

#include "api_json.h"
#include "bacnet_proxy.h"
#include "controllers/Responses.h"
#include "device_registry.h"
#include "transaction_engine.h"

#include <drogon/drogon.h>

namespace bacproxy {

namespace {

ProxyError invalid(const std::string &message) { return makeError(ErrorKind::InvalidRequest, message); }

// device_address wins; device_instance is looked up among the last scan's devices.
Result<DeviceAnnouncement> resolveDevice(const std::optional<std::string> &address,
                                         const std::optional<std::string> &instance) {
    if (address) {
        const auto endpoint = parseDeviceAddress(*address);
        if (!endpoint) {
            return invalid("device_address '" + *address + "' is not an IPv4 address");
        }
        if (auto known = DeviceRegistry::instance().findByAddress(*endpoint)) {
            return *known;
        }
        DeviceAnnouncement unknown;
        unknown.source = *endpoint;
        return unknown;
    }
    if (instance) {
        const auto number = parseUnsigned(*instance);
        if (!number) {
            return invalid("device_instance must be an unsigned integer, got '" + *instance + "'");
        }
        if (auto known = DeviceRegistry::instance().findByInstance(*number)) {
            return *known;
        }
        return invalid("device " + *instance + " is not among the scanned devices; run a scan first");
    }
    return invalid("device_address or device_instance is required");
}

Result<ObjectId> objectParam(const std::string &name, const std::optional<std::string> &text) {
    if (!text) {
        return invalid(name + " is required");
    }
    const auto id = parseObjectId(*text);
    if (!id) {
        return invalid(name + " '" + *text + "' is not an object identifier (e.g. analog-value,1)");
    }
    return *id;
}

Result<std::uint32_t> propertyParam(const std::optional<std::string> &text) {
    if (!text) {
        return invalid("property_identifier is required");
    }
    const auto property = parsePropertyId(*text);
    if (!property) {
        return invalid("property_identifier '" + *text + "' is not a known property");
    }
    return *property;
}

// JSON bodies may carry identifiers as strings or plain numbers.
std::optional<std::string> jsonText(const Json::Value &body, const char *key) {
    const auto &value = body[key];
    if (value.isString() && !value.asString().empty()) {
        return value.asString();
    }
    if (value.isUInt()) {
        return std::to_string(value.asUInt());
    }
    return std::nullopt;
}

} // namespace

void PointController::readProperty(const drogon::HttpRequestPtr &req,
                                   std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
    auto device = resolveDevice(queryParam(req, "device_address"), queryParam(req, "device_instance"));
    if (!device) {
        callback(errorResponse(req, device.error()));
        return;
    }
    auto object = objectParam("object_identifier", queryParam(req, "object_identifier"));
    if (!object) {
        callback(errorResponse(req, object.error()));
        return;
    }
    auto property = propertyParam(queryParam(req, "property_identifier"));
    if (!property) {
        callback(errorResponse(req, property.error()));
        return;
    }
    auto index = uintParam(req, "property_array_index");
    if (!index) {
        callback(errorResponse(req, index.error()));
        return;
    }

    const PropertyReference ref{device->source, object.value(), property.value(), index.value()};
    runEngineTask([req, callback = std::move(callback), ref]() {
        TransactionEngine engine(BacnetProxy::instance());
        auto value = engine.readProperty(ref);
        if (!value) {
            callback(errorResponse(req, value.error()));
            return;
        }

        Json::Value body;
        body["device_address"] = formatDeviceAddress(ref.device);
        body["object_identifier"] = formatObjectId(ref.object);
        body["property_identifier"] = propertyName(ref.property);
        if (ref.arrayIndex) {
            body["property_array_index"] = static_cast<Json::UInt>(*ref.arrayIndex);
        }
        body["value"] = api::valueToJson(value.value());
        callback(doneResponse(body));
    });
}

void PointController::writeProperty(const drogon::HttpRequestPtr &req,
                                    std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
    const auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        std::string reason = "request body must be a JSON object";
        if (!req->getJsonError().empty()) {
            reason += ": " + req->getJsonError();
        }
        callback(errorResponse(req, invalid(reason)));
        return;
    }
    const auto &body = *json;

    auto device = resolveDevice(jsonText(body, "device_address"), jsonText(body, "device_instance"));
    if (!device) {
        callback(errorResponse(req, device.error()));
        return;
    }
    auto object = objectParam("object_identifier", jsonText(body, "object_identifier"));
    if (!object) {
        callback(errorResponse(req, object.error()));
        return;
    }
    auto property = propertyParam(jsonText(body, "property_identifier"));
    if (!property) {
        callback(errorResponse(req, property.error()));
        return;
    }

    std::optional<std::uint32_t> index;
    if (body.isMember("property_array_index") && !body["property_array_index"].isNull()) {
        if (!body["property_array_index"].isUInt()) {
            callback(errorResponse(req, invalid("property_array_index must be an unsigned integer")));
            return;
        }
        index = body["property_array_index"].asUInt();
    }

    std::optional<std::uint8_t> priority;
    if (body.isMember("priority") && !body["priority"].isNull()) {
        const auto &raw = body["priority"];
        if (!raw.isUInt() || raw.asUInt() < kMinPriority || raw.asUInt() > kMaxPriority) {
            callback(errorResponse(req, invalid("priority must be an integer within 1..16")));
            return;
        }
        priority = static_cast<std::uint8_t>(raw.asUInt());
    }

    if (!body.isMember("value")) {
        callback(errorResponse(req, invalid("value is required (use null to relinquish)")));
        return;
    }
    std::optional<std::string> typeHint;
    if (body["type"].isString()) {
        typeHint = body["type"].asString();
    }
    auto value = api::jsonToValue(body["value"], typeHint);
    if (!value) {
        callback(errorResponse(req, value.error()));
        return;
    }

    const PropertyReference ref{device->source, object.value(), property.value(), index};
    runEngineTask([req, callback = std::move(callback), ref, value = value.value(), priority]() {
        TransactionEngine engine(BacnetProxy::instance());
        auto written = engine.writeProperty(ref, value, priority);
        if (!written) {
            callback(errorResponse(req, written.error()));
            return;
        }

        Json::Value reply;
        reply["device_address"] = formatDeviceAddress(ref.device);
        reply["object_identifier"] = formatObjectId(ref.object);
        reply["property_identifier"] = propertyName(ref.property);
        reply["value"] = api::valueToJson(value);
        if (priority) {
            reply["priority"] = static_cast<Json::UInt>(*priority);
        }
        callback(doneResponse(reply));
    });
}

void PointController::readDeviceAll(const drogon::HttpRequestPtr &req,
                                    std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
    auto device = resolveDevice(queryParam(req, "device_address"), queryParam(req, "device_instance"));
    if (!device) {
        callback(errorResponse(req, device.error()));
        return;
    }

    // A scanned device already told us its identifier.
    std::optional<std::string> deviceObjectText = queryParam(req, "device_object_identifier");
    ObjectId deviceObject = device->deviceId;
    if (deviceObjectText) {
        auto parsed = objectParam("device_object_identifier", deviceObjectText);
        if (!parsed) {
            callback(errorResponse(req, parsed.error()));
            return;
        }
        deviceObject = parsed.value();
    } else if (!DeviceRegistry::instance().findByAddress(device->source)) {
        callback(errorResponse(req, invalid("device_object_identifier is required for a device not found by a scan")));
        return;
    }

    runEngineTask([req, callback = std::move(callback), address = device->source, deviceObject]() {
        TransactionEngine engine(BacnetProxy::instance());
        auto snapshot = engine.readDeviceAll(address, deviceObject);
        if (!snapshot) {
            callback(errorResponse(req, snapshot.error()));
            return;
        }
        callback(doneResponse(api::snapshotToJson(snapshot.value())));
    });
}

} // namespace bacproxy
