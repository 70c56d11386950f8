#include "api_json.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <type_traits>

namespace bacproxy::api {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    value.erase(std::remove_if(value.begin(), value.end(), [](char c) { return c == '-' || c == '_'; }), value.end());
    return value;
}

Json::Value primitiveToJson(const PrimitiveValue &value) {
    return std::visit(
        [](const auto &v) -> Json::Value {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                return Json::Value();
            } else if constexpr (std::is_same_v<V, bool>) {
                return Json::Value(v);
            } else if constexpr (std::is_same_v<V, std::uint64_t>) {
                return Json::Value(static_cast<Json::UInt64>(v));
            } else if constexpr (std::is_same_v<V, std::int64_t>) {
                return Json::Value(static_cast<Json::Int64>(v));
            } else if constexpr (std::is_same_v<V, float> || std::is_same_v<V, double>) {
                return Json::Value(static_cast<double>(v));
            } else if constexpr (std::is_same_v<V, Enumerated>) {
                return Json::Value(static_cast<Json::UInt>(v.value));
            } else if constexpr (std::is_same_v<V, std::string>) {
                return Json::Value(v);
            } else if constexpr (std::is_same_v<V, OctetString>) {
                Json::Value bytes(Json::arrayValue);
                for (const auto b : v) {
                    bytes.append(static_cast<Json::UInt>(b));
                }
                return bytes;
            } else if constexpr (std::is_same_v<V, BitString>) {
                Json::Value bits(Json::arrayValue);
                for (const bool bit : v) {
                    bits.append(bit);
                }
                return bits;
            } else if constexpr (std::is_same_v<V, Date>) {
                Json::Value date;
                date["year"] = static_cast<Json::UInt>(v.year);
                date["month"] = static_cast<Json::UInt>(v.month);
                date["day"] = static_cast<Json::UInt>(v.day);
                date["weekday"] = static_cast<Json::UInt>(v.weekday);
                return date;
            } else if constexpr (std::is_same_v<V, Time>) {
                Json::Value time;
                time["hour"] = static_cast<Json::UInt>(v.hour);
                time["minute"] = static_cast<Json::UInt>(v.minute);
                time["second"] = static_cast<Json::UInt>(v.second);
                time["hundredths"] = static_cast<Json::UInt>(v.hundredths);
                return time;
            } else {
                return objectIdToJson(v);
            }
        },
        value);
}

std::optional<std::uint8_t> smallField(const Json::Value &json, const char *name, unsigned fallback) {
    if (!json.isMember(name)) {
        return static_cast<std::uint8_t>(fallback);
    }
    const auto &field = json[name];
    if (!field.isUInt() || field.asUInt() > 255U) {
        return std::nullopt;
    }
    return static_cast<std::uint8_t>(field.asUInt());
}

Result<PrimitiveValue> typedPrimitive(const Json::Value &json, const std::string &hint) {
    const auto type = toLower(hint);
    const auto invalid = [&hint](const std::string &expected) {
        return makeError(ErrorKind::InvalidRequest, "value does not match type '" + hint + "': expected " + expected);
    };

    if (type == "null") {
        return PrimitiveValue{std::monostate{}};
    }
    if (type == "boolean" || type == "bool") {
        if (!json.isBool()) {
            return invalid("true or false");
        }
        return PrimitiveValue{std::in_place_type<bool>, json.asBool()};
    }
    if (type == "unsigned" || type == "unsignedint" || type == "uint") {
        if (!json.isUInt64()) {
            return invalid("a non-negative integer");
        }
        return PrimitiveValue{std::in_place_type<std::uint64_t>, static_cast<std::uint64_t>(json.asUInt64())};
    }
    if (type == "signed" || type == "signedint" || type == "int" || type == "integer") {
        if (!json.isInt64()) {
            return invalid("an integer");
        }
        return PrimitiveValue{std::in_place_type<std::int64_t>, static_cast<std::int64_t>(json.asInt64())};
    }
    if (type == "real" || type == "float") {
        if (!json.isNumeric()) {
            return invalid("a number");
        }
        return PrimitiveValue{std::in_place_type<float>, static_cast<float>(json.asDouble())};
    }
    if (type == "double") {
        if (!json.isNumeric()) {
            return invalid("a number");
        }
        return PrimitiveValue{std::in_place_type<double>, json.asDouble()};
    }
    if (type == "enumerated" || type == "enum") {
        if (!json.isUInt()) {
            return invalid("a non-negative integer");
        }
        return PrimitiveValue{Enumerated{json.asUInt()}};
    }
    if (type == "characterstring" || type == "string" || type == "text") {
        if (!json.isString()) {
            return invalid("a string");
        }
        return PrimitiveValue{json.asString()};
    }
    if (type == "octetstring" || type == "octets" || type == "bytes") {
        if (!json.isArray()) {
            return invalid("an array of bytes");
        }
        OctetString bytes;
        for (const auto &b : json) {
            if (!b.isUInt() || b.asUInt() > 255U) {
                return invalid("an array of bytes");
            }
            bytes.push_back(static_cast<std::uint8_t>(b.asUInt()));
        }
        return PrimitiveValue{std::move(bytes)};
    }
    if (type == "bitstring" || type == "bits") {
        if (!json.isArray()) {
            return invalid("an array of booleans");
        }
        BitString bits;
        for (const auto &b : json) {
            if (!b.isBool()) {
                return invalid("an array of booleans");
            }
            bits.push_back(b.asBool());
        }
        return PrimitiveValue{std::move(bits)};
    }
    if (type == "date") {
        if (!json.isObject() || !json["year"].isUInt() || json["year"].asUInt() > 65535U) {
            return invalid("{year, month, day[, weekday]}");
        }
        const auto month = smallField(json, "month", 255U);
        const auto day = smallField(json, "day", 255U);
        const auto weekday = smallField(json, "weekday", 255U);
        if (!month || !day || !weekday) {
            return invalid("{year, month, day[, weekday]}");
        }
        return PrimitiveValue{Date{static_cast<std::uint16_t>(json["year"].asUInt()), *month, *day, *weekday}};
    }
    if (type == "time") {
        if (!json.isObject()) {
            return invalid("{hour, minute, second[, hundredths]}");
        }
        const auto hour = smallField(json, "hour", 255U);
        const auto minute = smallField(json, "minute", 255U);
        const auto second = smallField(json, "second", 255U);
        const auto hundredths = smallField(json, "hundredths", 0U);
        if (!hour || !minute || !second || !hundredths) {
            return invalid("{hour, minute, second[, hundredths]}");
        }
        return PrimitiveValue{Time{*hour, *minute, *second, *hundredths}};
    }
    if (type == "objectidentifier" || type == "objectid" || type == "oid") {
        if (!json.isString()) {
            return invalid("an object identifier such as \"analog-value,1\"");
        }
        const auto id = parseObjectId(json.asString());
        if (!id) {
            return invalid("an object identifier such as \"analog-value,1\"");
        }
        return PrimitiveValue{*id};
    }
    return makeError(ErrorKind::InvalidRequest, "unknown value type '" + hint + "'");
}

Result<PrimitiveValue> untypedPrimitive(const Json::Value &json) {
    if (json.isNull()) {
        return PrimitiveValue{std::monostate{}};
    }
    if (json.isBool()) {
        return PrimitiveValue{std::in_place_type<bool>, json.asBool()};
    }
    if (json.isNumeric()) {
        return PrimitiveValue{std::in_place_type<float>, static_cast<float>(json.asDouble())};
    }
    if (json.isString()) {
        return PrimitiveValue{json.asString()};
    }
    return makeError(ErrorKind::InvalidRequest, "value must be null, a boolean, a number, a string or an array "
                                                "of those; use 'type' for other BACnet types");
}

// Date, time, octet and bit strings arrive as JSON containers but are single values.
bool containerIsScalar(const std::string &hint) {
    const auto type = toLower(hint);
    return type == "date" || type == "time" || type == "octetstring" || type == "octets" || type == "bytes" ||
           type == "bitstring" || type == "bits";
}

} // namespace

int httpStatusFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidScanTarget:
    case ErrorKind::InvalidRequest:
        return 400;
    case ErrorKind::ProxyNotRunning:
    case ErrorKind::AlreadyRunning:
    case ErrorKind::ProxyStopped:
        return 409;
    case ErrorKind::Timeout:
        return 504;
    case ErrorKind::RemoteRejected:
        return 502;
    case ErrorKind::BindError:
    case ErrorKind::TransportError:
        return 500;
    }
    return 500;
}

Json::Value errorToJson(const ProxyError &error) {
    Json::Value json;
    json["status"] = "error";
    json["error"] = error.message;
    json["kind"] = errorKindName(error.kind);
    if (error.remote) {
        Json::Value remote;
        switch (error.remote->source) {
        case RemoteError::Source::Error:
            remote["source"] = "error";
            remote["errorClass"] = static_cast<Json::UInt>(error.remote->errorClass);
            break;
        case RemoteError::Source::Reject:
            remote["source"] = "reject";
            break;
        case RemoteError::Source::Abort:
            remote["source"] = "abort";
            break;
        }
        remote["errorCode"] = static_cast<Json::UInt>(error.remote->errorCode);
        remote["description"] = error.remote->description;
        json["remote"] = remote;
    }
    return json;
}

Json::Value valueToJson(const PropertyValue &value) {
    if (const auto *primitive = std::get_if<PrimitiveValue>(&value)) {
        return primitiveToJson(*primitive);
    }
    Json::Value list(Json::arrayValue);
    for (const auto &item : std::get<ValueList>(value)) {
        list.append(primitiveToJson(item));
    }
    return list;
}

Json::Value objectIdToJson(const ObjectId &id) {
    Json::Value json(Json::arrayValue);
    json.append(objectTypeName(id.type));
    json.append(static_cast<Json::UInt>(id.instance));
    return json;
}

Json::Value announcementToJson(const DeviceAnnouncement &announcement) {
    Json::Value json;
    json["pduSource"] = formatDeviceAddress(announcement.source);
    json["deviceIdentifier"] = objectIdToJson(announcement.deviceId);
    json["maxAPDULengthAccepted"] = static_cast<Json::UInt>(announcement.maxApdu);
    json["segmentationSupported"] = segmentationName(announcement.segmentation);
    json["vendorID"] = static_cast<Json::UInt>(announcement.vendorId);
    if (announcement.objectName) {
        json["object-name"] = *announcement.objectName;
    }
    json["scanned_ip_target"] = announcement.scannedTarget;
    json["device_instance"] = static_cast<Json::UInt>(announcement.deviceId.instance);
    return json;
}

Json::Value snapshotToJson(const DeviceSnapshot &snapshot) {
    Json::Value json;
    json["device_address"] = formatDeviceAddress(snapshot.device);
    json["device_object_identifier"] = formatObjectId(snapshot.deviceObject);
    json["failed_reads"] = static_cast<Json::UInt64>(snapshot.failedReads);
    Json::Value objects(Json::arrayValue);
    for (const auto &object : snapshot.objects) {
        Json::Value entry;
        entry["object_identifier"] = formatObjectId(object.object);
        Json::Value properties(Json::objectValue);
        for (const auto &reading : object.properties) {
            auto name = propertyName(reading.property);
            if (reading.arrayIndex) {
                name += "[" + std::to_string(*reading.arrayIndex) + "]";
            }
            if (const auto *value = std::get_if<PropertyValue>(&reading.outcome)) {
                properties[name] = valueToJson(*value);
            } else {
                const auto &error = std::get<ProxyError>(reading.outcome);
                Json::Value failure;
                failure["error"] = error.message;
                failure["kind"] = errorKindName(error.kind);
                properties[name] = failure;
            }
        }
        entry["properties"] = properties;
        objects.append(entry);
    }
    json["objects"] = objects;
    return json;
}

Json::Value statusToJson(const ProxyStatus &status) {
    Json::Value json;
    json["running"] = status.running;
    if (status.running) {
        json["address"] = status.address;
        json["port"] = static_cast<Json::UInt>(status.port);
        json["pending_exchanges"] = static_cast<Json::UInt64>(status.pendingExchanges);
        json["scan_in_progress"] = status.scanInProgress;
    }
    return json;
}

Result<PropertyValue> jsonToValue(const Json::Value &json, const std::optional<std::string> &typeHint) {
    const bool hinted = typeHint && !typeHint->empty();
    if (json.isArray() && !(hinted && containerIsScalar(*typeHint))) {
        ValueList items;
        for (const auto &element : json) {
            auto item = hinted ? typedPrimitive(element, *typeHint) : untypedPrimitive(element);
            if (!item) {
                return item.error();
            }
            items.push_back(std::move(item.value()));
        }
        return PropertyValue{std::move(items)};
    }
    auto primitive = hinted ? typedPrimitive(json, *typeHint) : untypedPrimitive(json);
    if (!primitive) {
        return primitive.error();
    }
    return PropertyValue{std::move(primitive.value())};
}

std::optional<bool> parseBool(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

} // namespace bacproxy::api
