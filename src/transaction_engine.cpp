#include "transaction_engine.h"

#include <iostream>

namespace bacproxy {

namespace {

std::string describeReference(const PropertyReference &ref) {
    std::string text = formatDeviceAddress(ref.device) + " " + formatObjectId(ref.object) + " " + propertyName(ref.property);
    if (ref.arrayIndex) {
        text += "[" + std::to_string(*ref.arrayIndex) + "]";
    }
    return text;
}

ProxyError rejected(const char *service, const Ipv4Endpoint &device, const RemoteError &remote) {
    auto error =
        makeError(ErrorKind::RemoteRejected,
                  std::string(service) + " rejected by " + formatDeviceAddress(device) + ": " + remote.description);
    error.remote = remote;
    return error;
}

Result<Acknowledged> validateReference(const PropertyReference &ref) {
    if (ref.device.ip == 0U || ref.device.port == 0U) {
        return makeError(ErrorKind::InvalidRequest, "device address is required");
    }
    if (ref.object.instance > kMaxInstance) {
        return makeError(ErrorKind::InvalidRequest, "object instance must be within 0..4194303");
    }
    return Acknowledged{};
}

bool isTeardown(const ProxyError &error) {
    return error.kind == ErrorKind::ProxyStopped || error.kind == ErrorKind::ProxyNotRunning;
}

std::optional<std::vector<ObjectId>> toObjectIds(const PropertyValue &value) {
    std::vector<ObjectId> ids;
    if (const auto *primitive = std::get_if<PrimitiveValue>(&value)) {
        if (const auto *id = std::get_if<ObjectId>(primitive)) {
            ids.push_back(*id);
            return ids;
        }
        return std::nullopt;
    }
    for (const auto &item : std::get<ValueList>(value)) {
        const auto *id = std::get_if<ObjectId>(&item);
        if (id == nullptr) {
            return std::nullopt;
        }
        ids.push_back(*id);
    }
    return ids;
}

std::optional<std::uint64_t> toCount(const PropertyValue &value) {
    if (const auto *primitive = std::get_if<PrimitiveValue>(&value)) {
        if (const auto *count = std::get_if<std::uint64_t>(primitive)) {
            return *count;
        }
    }
    return std::nullopt;
}

} // namespace

TransactionEngine::TransactionEngine(BacnetProxy &proxy, const PropertyProfile &profile)
    : proxy(proxy), profile(profile) {}

Result<codec::Message> TransactionEngine::exchange(ProxySession &session, const Ipv4Endpoint &device,
                                                   codec::ConfirmedService service, const Encoder &encode) {
    // Register before sending so a fast reply cannot slip past.
    auto pending = session.exchanges().open(device, service);
    if (!pending) {
        return pending.error();
    }
    auto frame = encode(pending.value()->invokeId());
    if (!frame) {
        return frame.error();
    }
    auto sent = session.send(device, frame.value());
    if (!sent) {
        return sent.error();
    }
    return pending.value()->wait(session.config().apduTimeout);
}

Result<PropertyValue> TransactionEngine::readOnce(ProxySession &session, const PropertyReference &ref) {
    auto reply = exchange(session, ref.device, codec::ConfirmedService::ReadProperty,
                          [&ref](std::uint8_t invokeId) -> Result<codec::Frame> {
                              return codec::encodeReadProperty(invokeId, ref.object, ref.property, ref.arrayIndex);
                          });
    if (!reply) {
        return reply.error();
    }
    if (const auto *ack = std::get_if<codec::ReadPropertyAck>(&reply.value())) {
        if (!(ack->object == ref.object) || ack->property != ref.property) {
            return makeError(ErrorKind::TransportError, "ReadProperty reply from " + formatDeviceAddress(ref.device) +
                                                            " names " + formatObjectId(ack->object) + " " +
                                                            propertyName(ack->property));
        }
        return ack->value;
    }
    if (const auto *failure = std::get_if<codec::FailureReply>(&reply.value())) {
        return rejected("ReadProperty", ref.device, failure->error);
    }
    return makeError(ErrorKind::TransportError, "unexpected reply to ReadProperty");
}

Result<PropertyValue> TransactionEngine::readProperty(const PropertyReference &ref) {
    if (auto valid = validateReference(ref); !valid) {
        return valid.error();
    }
    auto session = proxy.session();
    if (!session) {
        return session.error();
    }

    const unsigned retries = session.value()->config().apduRetries;
    for (unsigned attempt = 0;; ++attempt) {
        auto result = readOnce(*session.value(), ref);
        if (result || result.error().kind != ErrorKind::Timeout || attempt >= retries) {
            if (!result) {
                std::cerr << "[Transaction] ReadProperty " << describeReference(ref)
                          << " failed: " << result.error().describe() << std::endl;
            }
            return result;
        }
        std::cout << "[Transaction] ReadProperty " << describeReference(ref) << " timed out, retry " << (attempt + 1)
                  << "/" << retries << std::endl;
    }
}

Result<Acknowledged> TransactionEngine::writeProperty(const PropertyReference &ref, const PropertyValue &value,
                                                      std::optional<std::uint8_t> priority) {
    if (priority && (*priority < kMinPriority || *priority > kMaxPriority)) {
        return makeError(ErrorKind::InvalidRequest, "priority must be within 1..16");
    }
    if (auto valid = validateReference(ref); !valid) {
        return valid.error();
    }
    // Reject unencodable values before any I/O.
    if (auto trial = codec::encodeWriteProperty(0, ref.object, ref.property, ref.arrayIndex, value, priority); !trial) {
        return trial.error();
    }
    auto session = proxy.session();
    if (!session) {
        return session.error();
    }

    auto reply = exchange(*session.value(), ref.device, codec::ConfirmedService::WriteProperty,
                          [&](std::uint8_t invokeId) {
                              return codec::encodeWriteProperty(invokeId, ref.object, ref.property, ref.arrayIndex,
                                                                value, priority);
                          });
    if (!reply) {
        auto error = reply.error();
        if (error.kind == ErrorKind::Timeout) {
            error.message += "; outcome unknown, read the property back to confirm";
        }
        std::cerr << "[Transaction] WriteProperty " << describeReference(ref) << " failed: " << error.describe()
                  << std::endl;
        return error;
    }
    if (std::holds_alternative<codec::SimpleAck>(reply.value())) {
        std::cout << "[Transaction] WriteProperty " << describeReference(ref) << " = " << describeValue(value)
                  << (priority ? " @" + std::to_string(*priority) : std::string()) << " acknowledged" << std::endl;
        return Acknowledged{};
    }
    if (const auto *failure = std::get_if<codec::FailureReply>(&reply.value())) {
        auto error = rejected("WriteProperty", ref.device, failure->error);
        std::cerr << "[Transaction] " << error.message << std::endl;
        return error;
    }
    return makeError(ErrorKind::TransportError, "unexpected reply to WriteProperty");
}

Result<std::vector<ObjectId>> TransactionEngine::readObjectList(const Ipv4Endpoint &device,
                                                                const ObjectId &deviceObject) {
    PropertyReference ref{device, deviceObject, property_id::kObjectList, std::nullopt};
    auto whole = readProperty(ref);
    if (whole) {
        if (auto ids = toObjectIds(whole.value())) {
            return *ids;
        }
        std::cout << "[Transaction] object-list of " << formatDeviceAddress(device)
                  << " is not a list of identifiers; reading it element by element" << std::endl;
    } else if (whole.error().kind == ErrorKind::RemoteRejected) {
        std::cout << "[Transaction] object-list of " << formatDeviceAddress(device)
                  << " not readable in one APDU; reading it element by element" << std::endl;
    } else {
        return whole.error();
    }

    ref.arrayIndex = 0U;
    auto length = readProperty(ref);
    if (!length) {
        return length.error();
    }
    const auto count = toCount(length.value());
    if (!count) {
        return makeError(ErrorKind::TransportError,
                         "object-list length of " + formatDeviceAddress(device) + " is not an unsigned value");
    }

    if (*count > kMaxObjectListLength) {
        return makeError(ErrorKind::TransportError, formatDeviceAddress(device) + " reports an object-list of " +
                                                        std::to_string(*count) + " entries (limit " +
                                                        std::to_string(kMaxObjectListLength) + ")");
    }

    std::vector<ObjectId> ids;
    const auto last = static_cast<std::uint32_t>(*count);
    unsigned timeoutsInRow = 0;
    for (std::uint32_t index = 1; index <= last; ++index) {
        ref.arrayIndex = index;
        auto element = readProperty(ref);
        if (!element) {
            if (isTeardown(element.error())) {
                return element.error();
            }
            if (element.error().kind == ErrorKind::Timeout && ++timeoutsInRow >= kMaxConsecutiveElementTimeouts) {
                return makeError(ErrorKind::Timeout, formatDeviceAddress(device) +
                                                         " stopped answering object-list reads at index " +
                                                         std::to_string(index));
            }
            continue;
        }
        timeoutsInRow = 0;
        if (auto single = toObjectIds(element.value()); single && single->size() == 1) {
            ids.push_back(single->front());
        }
    }
    return ids;
}

Result<DeviceSnapshot> TransactionEngine::readDeviceAll(const Ipv4Endpoint &device, const ObjectId &deviceObject) {
    if (deviceObject.type != object_type::kDevice) {
        return makeError(ErrorKind::InvalidRequest,
                         "device_object_identifier must name a device object, got " + formatObjectId(deviceObject));
    }

    auto objects = readObjectList(device, deviceObject);
    if (!objects) {
        return objects.error();
    }

    DeviceSnapshot snapshot;
    snapshot.device = device;
    snapshot.deviceObject = deviceObject;
    for (const auto &object : objects.value()) {
        ObjectSnapshot entry;
        entry.object = object;
        for (const auto property : profile.propertiesFor(object.type)) {
            PropertyReading reading;
            reading.property = property;
            auto value = readProperty(PropertyReference{device, object, property, std::nullopt});
            if (value) {
                reading.outcome = value.value();
            } else {
                if (isTeardown(value.error())) {
                    return value.error();
                }
                reading.outcome = value.error();
                ++snapshot.failedReads;
            }
            entry.properties.push_back(std::move(reading));
        }
        snapshot.objects.push_back(std::move(entry));
    }

    std::cout << "[Transaction] read_device_all " << formatDeviceAddress(device) << ": " << snapshot.objects.size()
              << " objects, " << snapshot.failedReads << " failed reads" << std::endl;
    return snapshot;
}

} // namespace bacproxy
