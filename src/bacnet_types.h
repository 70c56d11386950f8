#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace bacproxy {

constexpr std::uint16_t kDefaultBacnetPort = 0xBAC0; // 47808
constexpr std::uint32_t kMaxInstance = 0x3FFFFF;
constexpr std::uint8_t kMinPriority = 1;
constexpr std::uint8_t kMaxPriority = 16;

// Object types and property identifiers the proxy refers to by name.
namespace object_type {
constexpr std::uint16_t kAnalogInput = 0;
constexpr std::uint16_t kAnalogOutput = 1;
constexpr std::uint16_t kAnalogValue = 2;
constexpr std::uint16_t kBinaryInput = 3;
constexpr std::uint16_t kBinaryOutput = 4;
constexpr std::uint16_t kBinaryValue = 5;
constexpr std::uint16_t kDevice = 8;
constexpr std::uint16_t kMultiStateInput = 13;
constexpr std::uint16_t kMultiStateOutput = 14;
constexpr std::uint16_t kMultiStateValue = 19;
} // namespace object_type

namespace property_id {
constexpr std::uint32_t kDescription = 28;
constexpr std::uint32_t kFirmwareRevision = 44;
constexpr std::uint32_t kModelName = 70;
constexpr std::uint32_t kNumberOfStates = 74;
constexpr std::uint32_t kObjectList = 76;
constexpr std::uint32_t kObjectName = 77;
constexpr std::uint32_t kPresentValue = 85;
constexpr std::uint32_t kPriorityArray = 87;
constexpr std::uint32_t kProtocolVersion = 98;
constexpr std::uint32_t kRelinquishDefault = 104;
constexpr std::uint32_t kStatusFlags = 111;
constexpr std::uint32_t kUnits = 117;
constexpr std::uint32_t kVendorName = 121;
} // namespace property_id

enum class ErrorKind {
    ProxyNotRunning,
    AlreadyRunning,
    BindError,
    InvalidScanTarget,
    InvalidRequest,
    Timeout,
    RemoteRejected,
    ProxyStopped,
    TransportError,
};

const char *errorKindName(ErrorKind kind);

// Details reported by the remote device when it refuses a confirmed request.
struct RemoteError {
    enum class Source { Error, Reject, Abort };

    Source source{Source::Error};
    std::uint32_t errorClass{0};
    std::uint32_t errorCode{0};
    std::string description;
};

struct ProxyError {
    ErrorKind kind{ErrorKind::TransportError};
    std::string message;
    std::optional<RemoteError> remote;

    [[nodiscard]] std::string describe() const;
};

ProxyError makeError(ErrorKind kind, std::string message);

template <typename T> class Result {
  public:
    Result(T value) : state(std::move(value)) {}
    Result(ProxyError error) : state(std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(state); }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T &value() { return std::get<T>(state); }
    [[nodiscard]] const T &value() const { return std::get<T>(state); }
    [[nodiscard]] const ProxyError &error() const { return std::get<ProxyError>(state); }

    T *operator->() { return &value(); }
    const T *operator->() const { return &value(); }

  private:
    std::variant<T, ProxyError> state;
};

struct Acknowledged {};

struct Ipv4Endpoint {
    std::uint32_t ip{0}; // host byte order
    std::uint16_t port{kDefaultBacnetPort};

    bool operator==(const Ipv4Endpoint &other) const { return ip == other.ip && port == other.port; }
    bool operator!=(const Ipv4Endpoint &other) const { return !(*this == other); }
    bool operator<(const Ipv4Endpoint &other) const {
        return ip != other.ip ? ip < other.ip : port < other.port;
    }
};

// "192.168.1.10" for the standard port, "192.168.1.10:47809" otherwise.
std::string formatDeviceAddress(const Ipv4Endpoint &endpoint);
std::optional<Ipv4Endpoint> parseDeviceAddress(const std::string &text);

struct ObjectId {
    std::uint16_t type{0};
    std::uint32_t instance{0};

    bool operator==(const ObjectId &other) const { return type == other.type && instance == other.instance; }
    bool operator<(const ObjectId &other) const {
        return type != other.type ? type < other.type : instance < other.instance;
    }
};

// Plain decimal within 0..UINT32_MAX; no sign, no whitespace.
std::optional<std::uint32_t> parseUnsigned(const std::string &text);

std::optional<ObjectId> parseObjectId(const std::string &text);
std::optional<std::uint32_t> parsePropertyId(const std::string &text);
std::optional<std::uint16_t> parseObjectType(const std::string &text);
std::string objectTypeName(std::uint16_t type);
std::string propertyName(std::uint32_t property);
std::string formatObjectId(const ObjectId &id);

struct Enumerated {
    std::uint32_t value{0};
    bool operator==(const Enumerated &other) const { return value == other.value; }
};

struct Date {
    std::uint16_t year{0};
    std::uint8_t month{0};
    std::uint8_t day{0};
    std::uint8_t weekday{0};
    bool operator==(const Date &other) const {
        return year == other.year && month == other.month && day == other.day && weekday == other.weekday;
    }
};

struct Time {
    std::uint8_t hour{0};
    std::uint8_t minute{0};
    std::uint8_t second{0};
    std::uint8_t hundredths{0};
    bool operator==(const Time &other) const {
        return hour == other.hour && minute == other.minute && second == other.second &&
               hundredths == other.hundredths;
    }
};

using BitString = std::vector<bool>;
using OctetString = std::vector<std::uint8_t>;

// std::monostate is the BACnet NULL value (used to relinquish a priority slot).
using PrimitiveValue = std::variant<
    std::monostate,
    bool,
    std::uint64_t,
    std::int64_t,
    float,
    double,
    Enumerated,
    std::string,
    OctetString,
    BitString,
    Date,
    Time,
    ObjectId>;

using ValueList = std::vector<PrimitiveValue>;

// A single primitive, or an array/list of primitives.
using PropertyValue = std::variant<PrimitiveValue, ValueList>;

std::string describeValue(const PropertyValue &value);

struct PropertyReference {
    Ipv4Endpoint device;
    ObjectId object;
    std::uint32_t property{0};
    std::optional<std::uint32_t> arrayIndex;
};

enum class Segmentation : std::uint8_t { Both = 0, Transmit = 1, Receive = 2, None = 3 };

const char *segmentationName(Segmentation segmentation);

struct DeviceAnnouncement {
    Ipv4Endpoint source;
    ObjectId deviceId{object_type::kDevice, 0};
    std::uint32_t maxApdu{0};
    Segmentation segmentation{Segmentation::None};
    std::uint16_t vendorId{0};
    std::optional<std::string> objectName;
    std::string scannedTarget;
};

struct InstanceRange {
    std::uint32_t low{0};
    std::uint32_t high{kMaxInstance};
};

struct ScanTarget {
    // CIDR block ("192.168.1.0/24"); a bare address means /32.
    std::optional<std::string> network;
    std::optional<InstanceRange> instances;
    std::optional<std::string> destination;

    static ScanTarget forNetwork(std::string cidr);
    static ScanTarget forRange(std::optional<InstanceRange> range, std::optional<std::string> destination);

    [[nodiscard]] std::string describe() const;
};

struct PropertyReading {
    std::uint32_t property{0};
    std::optional<std::uint32_t> arrayIndex;
    std::variant<PropertyValue, ProxyError> outcome;
};

struct ObjectSnapshot {
    ObjectId object;
    std::vector<PropertyReading> properties;
};

struct DeviceSnapshot {
    Ipv4Endpoint device;
    ObjectId deviceObject;
    std::vector<ObjectSnapshot> objects;
    std::size_t failedReads{0};
};

struct ProxyStatus {
    bool running{false};
    std::string address;
    std::uint16_t port{0};
    std::size_t pendingExchanges{0};
    bool scanInProgress{false};
};

} // namespace bacproxy
