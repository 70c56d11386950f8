#pragma once

#include "bacnet_types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace bacproxy {

/**
 * Thin adapter over bacnet-stack's encoders/decoders.
 *
 * Frames produced here are complete BACnet/IP datagrams (BVLL + NPDU + APDU)
 * ready to hand to a Transport. Nothing in here touches a socket or any of
 * bacnet-stack's global datalink/TSM state.
 */
namespace codec {

using Frame = std::vector<std::uint8_t>;

enum class ConfirmedService : std::uint8_t { ReadProperty = 12, WriteProperty = 15 };

// Outgoing requests.
Frame encodeWhoIs(const std::optional<InstanceRange> &range, bool broadcast);
Frame encodeReadProperty(std::uint8_t invokeId, const ObjectId &object, std::uint32_t property,
                         std::optional<std::uint32_t> arrayIndex);
Result<Frame> encodeWriteProperty(std::uint8_t invokeId, const ObjectId &object, std::uint32_t property,
                                  std::optional<std::uint32_t> arrayIndex, const PropertyValue &value,
                                  std::optional<std::uint8_t> priority);

// Replies a device sends. Used by the simulated network and the check tools.
Frame encodeIAm(std::uint32_t deviceInstance, std::uint32_t maxApdu, Segmentation segmentation, std::uint16_t vendorId,
                bool broadcast);
Result<Frame> encodeReadPropertyAck(std::uint8_t invokeId, const ObjectId &object, std::uint32_t property,
                                    std::optional<std::uint32_t> arrayIndex, const PropertyValue &value);
Frame encodeSimpleAck(std::uint8_t invokeId, ConfirmedService service);
Frame encodeErrorReply(std::uint8_t invokeId, ConfirmedService service, std::uint32_t errorClass,
                       std::uint32_t errorCode);
Frame encodeReject(std::uint8_t invokeId, std::uint8_t reason);
Frame encodeAbort(std::uint8_t invokeId, std::uint8_t reason);

struct IAm {
    std::uint32_t deviceInstance{0};
    std::uint32_t maxApdu{0};
    Segmentation segmentation{Segmentation::None};
    std::uint16_t vendorId{0};
};

struct WhoIs {
    std::optional<InstanceRange> range;
};

struct ReadPropertyRequest {
    std::uint8_t invokeId{0};
    ObjectId object;
    std::uint32_t property{0};
    std::optional<std::uint32_t> arrayIndex;
};

struct WritePropertyRequest {
    std::uint8_t invokeId{0};
    ObjectId object;
    std::uint32_t property{0};
    std::optional<std::uint32_t> arrayIndex;
    PropertyValue value;
    std::uint8_t priority{kMaxPriority};
};

struct ReadPropertyAck {
    std::uint8_t invokeId{0};
    ObjectId object;
    std::uint32_t property{0};
    std::optional<std::uint32_t> arrayIndex;
    PropertyValue value;
};

struct SimpleAck {
    std::uint8_t invokeId{0};
    std::uint8_t service{0};
};

// Error, Reject and Abort PDUs. Reject/Abort carry no service choice.
struct FailureReply {
    std::uint8_t invokeId{0};
    std::optional<std::uint8_t> service;
    RemoteError error;
};

using Message =
    std::variant<IAm, WhoIs, ReadPropertyRequest, WritePropertyRequest, ReadPropertyAck, SimpleAck, FailureReply>;

struct DecodedFrame {
    // Set for Forwarded-NPDU frames: the device that originated the message.
    std::optional<Ipv4Endpoint> originator;
    Message message;
};

// Returns nullopt for anything that is not a BACnet/IP frame carrying one of
// the messages above (network-layer messages, unsupported services, garbage).
std::optional<DecodedFrame> decodeFrame(const std::uint8_t *data, std::size_t length);

std::optional<std::uint8_t> invokeIdOf(const Message &message);

} // namespace codec
} // namespace bacproxy
