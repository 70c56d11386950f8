#pragma once

#include "bacnet_codec.h"
#include "bacnet_types.h"
#include "udp_transport.h"

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace bacproxy::test {

// Wire constants the simulated devices answer with.
constexpr std::uint32_t kErrorClassObject = 1;
constexpr std::uint32_t kErrorClassProperty = 2;
constexpr std::uint32_t kErrorUnknownObject = 31;
constexpr std::uint32_t kErrorUnknownProperty = 32;
constexpr std::uint32_t kErrorWriteAccessDenied = 40;
constexpr std::uint32_t kErrorInvalidArrayIndex = 42;
constexpr std::uint32_t kErrorPropertyIsNotAnArray = 50;
constexpr std::uint8_t kAbortSegmentationNotSupported = 4;

Ipv4Endpoint endpoint(const std::string &ip, std::uint16_t port = kDefaultBacnetPort);

/**
 * A BACnet device living on the simulated network.
 *
 * Requests are decoded and replies encoded with the production codec. The
 * device object itself is created with object-name, vendor-name and
 * object-list; commandable objects arbitrate present-value through a
 * 16-slot priority array with a relinquish default.
 */
class SimulatedDevice {
  public:
    SimulatedDevice(Ipv4Endpoint address, std::uint32_t instance, std::uint16_t vendorId = 260);

    [[nodiscard]] const Ipv4Endpoint &address() const { return addr; }
    [[nodiscard]] std::uint32_t instance() const { return deviceInstance; }
    [[nodiscard]] ObjectId deviceObject() const { return ObjectId{object_type::kDevice, deviceInstance}; }

    void addObject(const ObjectId &id, std::map<std::uint32_t, PropertyValue> properties);
    void addCommandable(const ObjectId &id, PrimitiveValue relinquishDefault,
                        std::map<std::uint32_t, PropertyValue> properties = {});
    void setProperty(const ObjectId &id, std::uint32_t property, PropertyValue value);
    void setReadOnly(const ObjectId &id, std::uint32_t property);

    [[nodiscard]] std::optional<PrimitiveValue> prioritySlot(const ObjectId &id, std::uint8_t priority) const;

    // Never answers anything.
    void setSilent(bool silent);
    // Answers every Who-Is twice.
    void setDuplicateAnnouncements(bool duplicate);
    // Whole object-list reads abort (segmentation needed) above this many entries.
    void setObjectListAbortThreshold(std::optional<std::size_t> threshold);
    // Reported as object-list[0] instead of the real length.
    void setObjectListLength(std::optional<std::uint64_t> length);
    // Goes quiet once this many requests have been answered.
    void setAnswerLimit(std::optional<std::size_t> limit);

    [[nodiscard]] std::size_t requestsHandled() const;

    // Replies for one incoming request (empty when the device stays quiet).
    std::vector<codec::Frame> handle(const codec::Message &request);

  private:
    struct Commandable {
        std::array<std::optional<PrimitiveValue>, kMaxPriority> slots;
        PrimitiveValue relinquishDefault;
    };

    struct Object {
        std::map<std::uint32_t, PropertyValue> properties;
        std::set<std::uint32_t> readOnly;
        std::optional<Commandable> commandable;
    };

    std::optional<PropertyValue> currentValue(const ObjectId &id, const Object &object, std::uint32_t property) const;
    ValueList objectList() const;
    codec::Frame readProperty(const codec::ReadPropertyRequest &request);
    codec::Frame writeProperty(const codec::WritePropertyRequest &request);

    Ipv4Endpoint addr;
    std::uint32_t deviceInstance;
    std::uint16_t vendor;

    mutable std::mutex mtx;
    std::map<ObjectId, Object> objects;
    bool silent{false};
    bool duplicateAnnouncements{false};
    std::optional<std::size_t> objectListAbortThreshold;
    std::optional<std::uint64_t> objectListLength;
    std::optional<std::size_t> answerLimit;
    std::size_t handled{0};
};

/**
 * In-process stand-in for the UDP transport.
 *
 * Frames the proxy sends are handed to the addressed devices (all of them for
 * a broadcast) and their replies are queued for the proxy's receive loop.
 */
class SimulatedNetwork : public Transport, public std::enable_shared_from_this<SimulatedNetwork> {
  public:
    explicit SimulatedNetwork(Ipv4Endpoint local = endpoint("10.0.0.5"));

    std::shared_ptr<SimulatedDevice> addDevice(const Ipv4Endpoint &address, std::uint32_t instance);

    // Queues an unsolicited datagram as if `source` had sent it.
    void inject(const Ipv4Endpoint &source, codec::Frame frame);

    // Produces this network on every start; records the options it got.
    TransportFactory factory();
    [[nodiscard]] std::optional<TransportOptions> lastOptions() const;

    [[nodiscard]] std::vector<std::pair<Ipv4Endpoint, codec::Frame>> sentFrames() const;
    [[nodiscard]] bool isClosed() const;

    Result<Acknowledged> send(const Ipv4Endpoint &destination, const std::vector<std::uint8_t> &frame) override;
    std::optional<Datagram> receive(std::chrono::milliseconds timeout) override;
    [[nodiscard]] Ipv4Endpoint localEndpoint() const override;
    void close() override;

  private:
    static bool isBroadcast(const Ipv4Endpoint &destination);

    Ipv4Endpoint local;

    mutable std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::shared_ptr<SimulatedDevice>> devices;
    std::deque<Datagram> inbound;
    std::vector<std::pair<Ipv4Endpoint, codec::Frame>> sent;
    std::optional<TransportOptions> options;
    bool closed{false};
};

} // namespace bacproxy::test
