#pragma once

#include "bacnet_types.h"

#include <json/json.h>

#include <optional>
#include <string>

namespace bacproxy::api {

// HTTP status code used for an error of this kind.
int httpStatusFor(ErrorKind kind);

Json::Value errorToJson(const ProxyError &error);
Json::Value valueToJson(const PropertyValue &value);
Json::Value objectIdToJson(const ObjectId &id);
Json::Value announcementToJson(const DeviceAnnouncement &announcement);
Json::Value snapshotToJson(const DeviceSnapshot &snapshot);
Json::Value statusToJson(const ProxyStatus &status);

// Without a type hint: null, boolean, number (sent as REAL), string, or an
// array of those. A hint ("unsigned", "enumerated", "date", ...) forces the
// BACnet type of the value or of every array element.
Result<PropertyValue> jsonToValue(const Json::Value &json, const std::optional<std::string> &typeHint);

// "1", "true", "yes", "on" (case-insensitive) and their negations.
std::optional<bool> parseBool(const std::string &text);

} // namespace bacproxy::api
