#pragma once

#include "bacnet_proxy.h"
#include "bacnet_types.h"
#include "property_profile.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace bacproxy {

// Longest object-list read element by element.
constexpr std::uint64_t kMaxObjectListLength = 65535;
// Element-by-element object-list reads give up after this many timeouts in a row.
constexpr unsigned kMaxConsecutiveElementTimeouts = 3;

/**
 * Point-to-point confirmed services against a single device.
 *
 * Every call blocks the caller until the matching reply arrives, the APDU
 * timeout elapses, or the proxy stops. ReadProperty is retried on timeout
 * when the proxy was configured with apduRetries > 0. WriteProperty is never
 * retried: after a timeout the outcome is unknown and the caller should read
 * the property back.
 */
class TransactionEngine {
  public:
    explicit TransactionEngine(BacnetProxy &proxy, const PropertyProfile &profile = PropertyProfile::instance());

    Result<PropertyValue> readProperty(const PropertyReference &ref);
    Result<Acknowledged> writeProperty(const PropertyReference &ref, const PropertyValue &value,
                                       std::optional<std::uint8_t> priority = std::nullopt);
    Result<DeviceSnapshot> readDeviceAll(const Ipv4Endpoint &device, const ObjectId &deviceObject);

  private:
    using Encoder = std::function<Result<codec::Frame>(std::uint8_t invokeId)>;

    Result<codec::Message> exchange(ProxySession &session, const Ipv4Endpoint &device, codec::ConfirmedService service,
                                    const Encoder &encode);
    Result<PropertyValue> readOnce(ProxySession &session, const PropertyReference &ref);
    Result<std::vector<ObjectId>> readObjectList(const Ipv4Endpoint &device, const ObjectId &deviceObject);

    BacnetProxy &proxy;
    const PropertyProfile &profile;
};

} // namespace bacproxy
