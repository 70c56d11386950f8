#include "bacnet_types.h"

#include "address_resolver.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>

extern "C" {
#include <bacnet/bactext.h>
}

namespace bacproxy {

namespace {

// "analogValue" / "analog_value" / "Analog-Value" -> "analog-value"
std::string normaliseIdentifierName(const std::string &raw) {
    std::string result;
    result.reserve(raw.size() + 4);
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const auto c = static_cast<unsigned char>(raw[i]);
        if (c == '_' || c == ' ') {
            result.push_back('-');
            continue;
        }
        if (std::isupper(c) && i > 0 && raw[i - 1] != '-' && raw[i - 1] != '_' &&
            !std::isupper(static_cast<unsigned char>(raw[i - 1]))) {
            result.push_back('-');
        }
        result.push_back(static_cast<char>(std::tolower(c)));
    }
    return result;
}

std::string trim(const std::string &value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

} // namespace

std::optional<std::uint32_t> parseUnsigned(const std::string &text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        const auto parsed = std::stoull(text);
        if (parsed > 0xFFFFFFFFULL) {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ProxyNotRunning:
        return "ProxyNotRunning";
    case ErrorKind::AlreadyRunning:
        return "AlreadyRunning";
    case ErrorKind::BindError:
        return "BindError";
    case ErrorKind::InvalidScanTarget:
        return "InvalidScanTarget";
    case ErrorKind::InvalidRequest:
        return "InvalidRequest";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::RemoteRejected:
        return "RemoteRejected";
    case ErrorKind::ProxyStopped:
        return "ProxyStopped";
    case ErrorKind::TransportError:
        return "TransportError";
    }
    return "Unknown";
}

std::string ProxyError::describe() const {
    std::string text = std::string(errorKindName(kind)) + ": " + message;
    if (remote && !remote->description.empty()) {
        text += " (" + remote->description + ")";
    }
    return text;
}

ProxyError makeError(ErrorKind kind, std::string message) {
    ProxyError error;
    error.kind = kind;
    error.message = std::move(message);
    return error;
}

std::string formatDeviceAddress(const Ipv4Endpoint &endpoint) {
    auto text = formatIp(endpoint.ip);
    if (endpoint.port != kDefaultBacnetPort) {
        text += ':' + std::to_string(endpoint.port);
    }
    return text;
}

std::optional<Ipv4Endpoint> parseDeviceAddress(const std::string &text) {
    const auto trimmed = trim(text);
    Ipv4Endpoint endpoint;
    std::string host = trimmed;
    if (const auto colon = trimmed.find(':'); colon != std::string::npos) {
        host = trimmed.substr(0, colon);
        const auto port = parseUnsigned(trimmed.substr(colon + 1));
        if (!port || *port == 0U || *port > 65535U) {
            return std::nullopt;
        }
        endpoint.port = static_cast<std::uint16_t>(*port);
    }
    const auto ip = parseIp(host);
    if (!ip || *ip == 0U) {
        return std::nullopt;
    }
    endpoint.ip = *ip;
    return endpoint;
}

std::optional<std::uint16_t> parseObjectType(const std::string &text) {
    const auto trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (const auto numeric = parseUnsigned(trimmed)) {
        if (*numeric > 1023U) {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(*numeric);
    }
    const auto name = normaliseIdentifierName(trimmed);
    unsigned found = 0;
    if (!bactext_object_type_strtol(name.c_str(), &found) || found > 1023U) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(found);
}

std::optional<ObjectId> parseObjectId(const std::string &text) {
    const auto trimmed = trim(text);
    const auto separator = trimmed.find_last_of(",: ");
    if (separator == std::string::npos || separator == 0 || separator + 1 >= trimmed.size()) {
        return std::nullopt;
    }
    auto typePart = trim(trimmed.substr(0, separator));
    while (!typePart.empty() && (typePart.back() == ',' || typePart.back() == ':')) {
        typePart = trim(typePart.substr(0, typePart.size() - 1));
    }
    const auto type = parseObjectType(typePart);
    const auto instance = parseUnsigned(trim(trimmed.substr(separator + 1)));
    if (!type || !instance || *instance > kMaxInstance) {
        return std::nullopt;
    }
    return ObjectId{*type, *instance};
}

std::optional<std::uint32_t> parsePropertyId(const std::string &text) {
    const auto trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (const auto numeric = parseUnsigned(trimmed)) {
        return numeric;
    }
    const auto name = normaliseIdentifierName(trimmed);
    unsigned found = 0;
    if (!bactext_property_strtol(name.c_str(), &found)) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(found);
}

std::string objectTypeName(std::uint16_t type) {
    const std::string name = bactext_object_type_name(type);
    // bactext reports reserved/proprietary ranges with a descriptive phrase.
    if (name.empty() || name.find(' ') != std::string::npos) {
        return std::to_string(type);
    }
    return name;
}

std::string propertyName(std::uint32_t property) {
    const std::string name = bactext_property_name(property);
    if (name.empty() || name.find(' ') != std::string::npos) {
        return std::to_string(property);
    }
    return name;
}

std::string formatObjectId(const ObjectId &id) {
    return objectTypeName(id.type) + "," + std::to_string(id.instance);
}

const char *segmentationName(Segmentation segmentation) {
    switch (segmentation) {
    case Segmentation::Both:
        return "segmentedBoth";
    case Segmentation::Transmit:
        return "segmentedTransmit";
    case Segmentation::Receive:
        return "segmentedReceive";
    case Segmentation::None:
        return "noSegmentation";
    }
    return "noSegmentation";
}

namespace {

void describePrimitive(std::ostringstream &oss, const PrimitiveValue &value) {
    std::visit(
        [&oss](const auto &v) {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                oss << "null";
            } else if constexpr (std::is_same_v<V, bool>) {
                oss << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<V, Enumerated>) {
                oss << "enum(" << v.value << ')';
            } else if constexpr (std::is_same_v<V, std::string>) {
                oss << '"' << v << '"';
            } else if constexpr (std::is_same_v<V, OctetString>) {
                oss << "octets[" << v.size() << ']';
            } else if constexpr (std::is_same_v<V, BitString>) {
                for (const bool bit : v) {
                    oss << (bit ? '1' : '0');
                }
            } else if constexpr (std::is_same_v<V, Date>) {
                oss << v.year << '-' << static_cast<unsigned>(v.month) << '-' << static_cast<unsigned>(v.day);
            } else if constexpr (std::is_same_v<V, Time>) {
                oss << static_cast<unsigned>(v.hour) << ':' << static_cast<unsigned>(v.minute) << ':'
                    << static_cast<unsigned>(v.second) << '.' << static_cast<unsigned>(v.hundredths);
            } else if constexpr (std::is_same_v<V, ObjectId>) {
                oss << formatObjectId(v);
            } else {
                oss << v;
            }
        },
        value);
}

} // namespace

std::string describeValue(const PropertyValue &value) {
    std::ostringstream oss;
    if (const auto *primitive = std::get_if<PrimitiveValue>(&value)) {
        describePrimitive(oss, *primitive);
        return oss.str();
    }
    const auto &list = std::get<ValueList>(value);
    oss << '[';
    for (std::size_t i = 0; i < list.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        describePrimitive(oss, list[i]);
    }
    oss << ']';
    return oss.str();
}

ScanTarget ScanTarget::forNetwork(std::string cidr) {
    ScanTarget target;
    target.network = std::move(cidr);
    return target;
}

ScanTarget ScanTarget::forRange(std::optional<InstanceRange> range, std::optional<std::string> destination) {
    ScanTarget target;
    target.instances = range;
    target.destination = std::move(destination);
    return target;
}

std::string ScanTarget::describe() const {
    std::string text;
    if (network) {
        text = *network;
    } else if (destination) {
        text = *destination;
    } else {
        text = "global-broadcast";
    }
    if (instances) {
        text += " [" + std::to_string(instances->low) + ".." + std::to_string(instances->high) + "]";
    }
    return text;
}

} // namespace bacproxy
