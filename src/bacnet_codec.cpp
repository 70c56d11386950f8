#include "bacnet_codec.h"

#include <array>
#include <cstring>
#include <limits>
#include <string>
#include <type_traits>

extern "C" {
#include <bacnet/abort.h>
#include <bacnet/bacapp.h>
#include <bacnet/bacdcode.h>
#include <bacnet/bacdef.h>
#include <bacnet/bacenum.h>
#include <bacnet/bacerror.h>
#include <bacnet/bacstr.h>
#include <bacnet/bactext.h>
#include <bacnet/datalink/bvlc.h>
#include <bacnet/iam.h>
#include <bacnet/npdu.h>
#include <bacnet/reject.h>
#include <bacnet/rp.h>
#include <bacnet/whois.h>
#include <bacnet/wp.h>
}

namespace bacproxy::codec {

namespace {

constexpr std::size_t kFrameCapacity = 1536;
constexpr std::size_t kBvllHeaderLength = 4;
constexpr std::size_t kForwardedAddressLength = 6;

using ApduBuffer = std::array<std::uint8_t, MAX_APDU>;

Frame wrapApdu(const std::uint8_t *apdu, int apduLength, bool expectingReply, bool broadcast) {
    BACNET_ADDRESS dest{};
    BACNET_ADDRESS src{};
    BACNET_NPDU_DATA npduData{};
    npdu_encode_npdu_data(&npduData, expectingReply, MESSAGE_PRIORITY_NORMAL);

    std::array<std::uint8_t, kFrameCapacity> npdu{};
    int npduLength = npdu_encode_pdu(npdu.data(), &dest, &src, &npduData);
    if (npduLength <= 0 || apduLength <= 0 ||
        static_cast<std::size_t>(npduLength + apduLength) + kBvllHeaderLength > kFrameCapacity) {
        return {};
    }
    std::memcpy(npdu.data() + npduLength, apdu, static_cast<std::size_t>(apduLength));
    npduLength += apduLength;

    Frame frame(kFrameCapacity);
    const auto frameSize = static_cast<std::uint16_t>(frame.size());
    const int total = broadcast ? bvlc_encode_original_broadcast(frame.data(), frameSize, npdu.data(),
                                                                 static_cast<std::uint16_t>(npduLength))
                                : bvlc_encode_original_unicast(frame.data(), frameSize, npdu.data(),
                                                               static_cast<std::uint16_t>(npduLength));
    frame.resize(total > 0 ? static_cast<std::size_t>(total) : 0U);
    return frame;
}

BACNET_ARRAY_INDEX toArrayIndex(std::optional<std::uint32_t> index) {
    return index ? static_cast<BACNET_ARRAY_INDEX>(*index) : BACNET_ARRAY_ALL;
}

std::optional<std::uint32_t> fromArrayIndex(BACNET_ARRAY_INDEX index) {
    if (index == BACNET_ARRAY_ALL) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(index);
}

std::optional<PrimitiveValue> fromApplicationData(BACNET_APPLICATION_DATA_VALUE &data) {
    switch (data.tag) {
    case BACNET_APPLICATION_TAG_NULL:
        return PrimitiveValue{std::monostate{}};
    case BACNET_APPLICATION_TAG_BOOLEAN:
        return PrimitiveValue{std::in_place_type<bool>, data.type.Boolean};
    case BACNET_APPLICATION_TAG_UNSIGNED_INT:
        return PrimitiveValue{std::in_place_type<std::uint64_t>, static_cast<std::uint64_t>(data.type.Unsigned_Int)};
    case BACNET_APPLICATION_TAG_SIGNED_INT:
        return PrimitiveValue{std::in_place_type<std::int64_t>, static_cast<std::int64_t>(data.type.Signed_Int)};
    case BACNET_APPLICATION_TAG_REAL:
        return PrimitiveValue{std::in_place_type<float>, data.type.Real};
    case BACNET_APPLICATION_TAG_DOUBLE:
        return PrimitiveValue{std::in_place_type<double>, data.type.Double};
    case BACNET_APPLICATION_TAG_OCTET_STRING: {
        const auto *bytes = octetstring_value(&data.type.Octet_String);
        const auto length = octetstring_length(&data.type.Octet_String);
        return PrimitiveValue{std::in_place_type<OctetString>, bytes, bytes + length};
    }
    case BACNET_APPLICATION_TAG_CHARACTER_STRING: {
        const char *text = characterstring_value(&data.type.Character_String);
        const auto length = characterstring_length(&data.type.Character_String);
        return PrimitiveValue{std::in_place_type<std::string>, text, length};
    }
    case BACNET_APPLICATION_TAG_BIT_STRING: {
        BitString bits;
        const auto used = bitstring_bits_used(&data.type.Bit_String);
        for (std::uint8_t bit = 0; bit < used; ++bit) {
            bits.push_back(bitstring_bit(&data.type.Bit_String, bit));
        }
        return PrimitiveValue{std::move(bits)};
    }
    case BACNET_APPLICATION_TAG_ENUMERATED:
        return PrimitiveValue{Enumerated{static_cast<std::uint32_t>(data.type.Enumerated)}};
    case BACNET_APPLICATION_TAG_DATE:
        return PrimitiveValue{Date{static_cast<std::uint16_t>(data.type.Date.year), data.type.Date.month,
                                   data.type.Date.day, data.type.Date.wday}};
    case BACNET_APPLICATION_TAG_TIME:
        return PrimitiveValue{Time{data.type.Time.hour, data.type.Time.min, data.type.Time.sec,
                                   data.type.Time.hundredths}};
    case BACNET_APPLICATION_TAG_OBJECT_ID:
        return PrimitiveValue{ObjectId{static_cast<std::uint16_t>(data.type.Object_Id.type),
                                       static_cast<std::uint32_t>(data.type.Object_Id.instance)}};
    default:
        return std::nullopt;
    }
}

// Returns an error message when the value cannot be represented on the wire.
std::optional<std::string> toApplicationData(const PrimitiveValue &value, BACNET_APPLICATION_DATA_VALUE &out) {
    out = BACNET_APPLICATION_DATA_VALUE{};
    return std::visit(
        [&out](const auto &v) -> std::optional<std::string> {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                out.tag = BACNET_APPLICATION_TAG_NULL;
            } else if constexpr (std::is_same_v<V, bool>) {
                out.tag = BACNET_APPLICATION_TAG_BOOLEAN;
                out.type.Boolean = v;
            } else if constexpr (std::is_same_v<V, std::uint64_t>) {
                if (v > static_cast<std::uint64_t>(std::numeric_limits<BACNET_UNSIGNED_INTEGER>::max())) {
                    return "unsigned value out of range";
                }
                out.tag = BACNET_APPLICATION_TAG_UNSIGNED_INT;
                out.type.Unsigned_Int = static_cast<BACNET_UNSIGNED_INTEGER>(v);
            } else if constexpr (std::is_same_v<V, std::int64_t>) {
                if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) {
                    return "signed value out of range";
                }
                out.tag = BACNET_APPLICATION_TAG_SIGNED_INT;
                out.type.Signed_Int = static_cast<std::int32_t>(v);
            } else if constexpr (std::is_same_v<V, float>) {
                out.tag = BACNET_APPLICATION_TAG_REAL;
                out.type.Real = v;
            } else if constexpr (std::is_same_v<V, double>) {
                out.tag = BACNET_APPLICATION_TAG_DOUBLE;
                out.type.Double = v;
            } else if constexpr (std::is_same_v<V, Enumerated>) {
                out.tag = BACNET_APPLICATION_TAG_ENUMERATED;
                out.type.Enumerated = v.value;
            } else if constexpr (std::is_same_v<V, std::string>) {
                out.tag = BACNET_APPLICATION_TAG_CHARACTER_STRING;
                if (!characterstring_init(&out.type.Character_String, CHARACTER_ANSI_X34, v.c_str(), v.size())) {
                    return "character string too long";
                }
            } else if constexpr (std::is_same_v<V, OctetString>) {
                out.tag = BACNET_APPLICATION_TAG_OCTET_STRING;
                auto bytes = v;
                if (!octetstring_init(&out.type.Octet_String, bytes.data(), bytes.size())) {
                    return "octet string too long";
                }
            } else if constexpr (std::is_same_v<V, BitString>) {
                out.tag = BACNET_APPLICATION_TAG_BIT_STRING;
                if (v.size() > MAX_BITSTRING_BYTES * 8U) {
                    return "bit string too long";
                }
                bitstring_init(&out.type.Bit_String);
                for (std::size_t bit = 0; bit < v.size(); ++bit) {
                    bitstring_set_bit(&out.type.Bit_String, static_cast<std::uint8_t>(bit), v[bit]);
                }
            } else if constexpr (std::is_same_v<V, Date>) {
                out.tag = BACNET_APPLICATION_TAG_DATE;
                out.type.Date.year = v.year;
                out.type.Date.month = v.month;
                out.type.Date.day = v.day;
                out.type.Date.wday = v.weekday;
            } else if constexpr (std::is_same_v<V, Time>) {
                out.tag = BACNET_APPLICATION_TAG_TIME;
                out.type.Time.hour = v.hour;
                out.type.Time.min = v.minute;
                out.type.Time.sec = v.second;
                out.type.Time.hundredths = v.hundredths;
            } else if constexpr (std::is_same_v<V, ObjectId>) {
                if (v.instance > kMaxInstance) {
                    return "object instance out of range";
                }
                out.tag = BACNET_APPLICATION_TAG_OBJECT_ID;
                out.type.Object_Id.type = static_cast<BACNET_OBJECT_TYPE>(v.type);
                out.type.Object_Id.instance = v.instance;
            }
            return std::nullopt;
        },
        value);
}

// Appends the application-tagged encoding of `value` at `dest`; returns the
// number of bytes written.
Result<int> encodeValue(const PropertyValue &value, std::uint8_t *dest, std::size_t capacity) {
    ValueList items;
    if (const auto *primitive = std::get_if<PrimitiveValue>(&value)) {
        items.push_back(*primitive);
    } else {
        items = std::get<ValueList>(value);
    }

    int written = 0;
    ApduBuffer scratch{};
    for (const auto &item : items) {
        BACNET_APPLICATION_DATA_VALUE data{};
        if (auto problem = toApplicationData(item, data)) {
            return makeError(ErrorKind::InvalidRequest, *problem);
        }
        const int length = bacapp_encode_application_data(scratch.data(), &data);
        if (length <= 0) {
            return makeError(ErrorKind::InvalidRequest, "value cannot be encoded");
        }
        if (static_cast<std::size_t>(written + length) > capacity) {
            return makeError(ErrorKind::InvalidRequest, "value does not fit into a single APDU");
        }
        std::memcpy(dest + written, scratch.data(), static_cast<std::size_t>(length));
        written += length;
    }
    return written;
}

PropertyValue decodeValues(std::uint8_t *data, int length) {
    ValueList values;
    int offset = 0;
    while (data != nullptr && offset < length) {
        BACNET_APPLICATION_DATA_VALUE item{};
        const int used = bacapp_decode_application_data(data + offset, static_cast<unsigned>(length - offset), &item);
        if (used <= 0) {
            break;
        }
        auto primitive = fromApplicationData(item);
        if (!primitive) {
            break;
        }
        values.push_back(std::move(*primitive));
        offset += used;
    }
    if (offset != length) {
        // Constructed or context-tagged data: hand back the raw encoding.
        return PrimitiveValue{std::in_place_type<OctetString>, data, data + length};
    }
    if (values.size() == 1) {
        return PropertyValue{std::move(values.front())};
    }
    return PropertyValue{std::move(values)};
}

RemoteError describeError(std::uint32_t errorClass, std::uint32_t errorCode) {
    RemoteError error;
    error.source = RemoteError::Source::Error;
    error.errorClass = errorClass;
    error.errorCode = errorCode;
    error.description = std::string(bactext_error_class_name(errorClass)) + "/" + bactext_error_code_name(errorCode);
    return error;
}

RemoteError describeReject(std::uint8_t reason) {
    RemoteError error;
    error.source = RemoteError::Source::Reject;
    error.errorCode = reason;
    error.description = std::string("reject: ") + bactext_reject_reason_name(reason);
    return error;
}

RemoteError describeAbort(std::uint8_t reason) {
    RemoteError error;
    error.source = RemoteError::Source::Abort;
    error.errorCode = reason;
    error.description = std::string("abort: ") + bactext_abort_reason_name(reason);
    return error;
}

std::optional<Message> decodeUnconfirmed(std::uint8_t *apdu, int length) {
    if (length < 2) {
        return std::nullopt;
    }
    switch (apdu[1]) {
    case SERVICE_UNCONFIRMED_I_AM: {
        std::uint32_t deviceId = 0;
        unsigned maxApdu = 0;
        int segmentation = 0;
        std::uint16_t vendorId = 0;
        if (iam_decode_service_request(&apdu[2], &deviceId, &maxApdu, &segmentation, &vendorId) <= 0) {
            return std::nullopt;
        }
        IAm iam;
        iam.deviceInstance = deviceId;
        iam.maxApdu = maxApdu;
        iam.segmentation = segmentation >= 0 && segmentation <= 3 ? static_cast<Segmentation>(segmentation)
                                                                  : Segmentation::None;
        iam.vendorId = vendorId;
        return Message{iam};
    }
    case SERVICE_UNCONFIRMED_WHO_IS: {
        std::int32_t low = -1;
        std::int32_t high = -1;
        if (length > 2 &&
            whois_decode_service_request(&apdu[2], static_cast<unsigned>(length - 2), &low, &high) <= 0) {
            return std::nullopt;
        }
        WhoIs whoIs;
        if (low >= 0 && high >= 0) {
            whoIs.range = InstanceRange{static_cast<std::uint32_t>(low), static_cast<std::uint32_t>(high)};
        }
        return Message{whoIs};
    }
    default:
        return std::nullopt;
    }
}

std::optional<Message> decodeConfirmedRequest(std::uint8_t *apdu, int length) {
    // Segmented requests are never produced by this proxy or its peers under test.
    if (length < 4 || (apdu[0] & 0x08U) != 0U) {
        return std::nullopt;
    }
    const std::uint8_t invokeId = apdu[2];
    const std::uint8_t service = apdu[3];
    auto *serviceData = &apdu[4];
    const auto serviceLength = static_cast<unsigned>(length - 4);

    if (service == SERVICE_CONFIRMED_READ_PROPERTY) {
        BACNET_READ_PROPERTY_DATA rpdata{};
        if (rp_decode_service_request(serviceData, serviceLength, &rpdata) <= 0) {
            return std::nullopt;
        }
        ReadPropertyRequest request;
        request.invokeId = invokeId;
        request.object = ObjectId{static_cast<std::uint16_t>(rpdata.object_type), rpdata.object_instance};
        request.property = static_cast<std::uint32_t>(rpdata.object_property);
        request.arrayIndex = fromArrayIndex(rpdata.array_index);
        return Message{request};
    }
    if (service == SERVICE_CONFIRMED_WRITE_PROPERTY) {
        BACNET_WRITE_PROPERTY_DATA wpdata{};
        if (wp_decode_service_request(serviceData, serviceLength, &wpdata) <= 0) {
            return std::nullopt;
        }
        WritePropertyRequest request;
        request.invokeId = invokeId;
        request.object = ObjectId{static_cast<std::uint16_t>(wpdata.object_type), wpdata.object_instance};
        request.property = static_cast<std::uint32_t>(wpdata.object_property);
        request.arrayIndex = fromArrayIndex(wpdata.array_index);
        request.value = decodeValues(wpdata.application_data, wpdata.application_data_len);
        request.priority = wpdata.priority == BACNET_NO_PRIORITY ? kMaxPriority : wpdata.priority;
        return Message{request};
    }
    return std::nullopt;
}

std::optional<Message> decodeApdu(std::uint8_t *apdu, int length) {
    if (length < 2) {
        return std::nullopt;
    }
    switch (apdu[0] & 0xF0U) {
    case PDU_TYPE_UNCONFIRMED_SERVICE_REQUEST:
        return decodeUnconfirmed(apdu, length);
    case PDU_TYPE_CONFIRMED_SERVICE_REQUEST:
        return decodeConfirmedRequest(apdu, length);
    case PDU_TYPE_SIMPLE_ACK:
        if (length < 3) {
            return std::nullopt;
        }
        return Message{SimpleAck{apdu[1], apdu[2]}};
    case PDU_TYPE_COMPLEX_ACK: {
        if ((apdu[0] & 0x08U) != 0U) {
            // Segmented reply; segmentation is never negotiated, so report it
            // as a failed exchange rather than silently dropping it.
            FailureReply failure;
            failure.invokeId = apdu[1];
            failure.error = describeAbort(ABORT_REASON_SEGMENTATION_NOT_SUPPORTED);
            return Message{failure};
        }
        if (length < 3 || apdu[2] != SERVICE_CONFIRMED_READ_PROPERTY) {
            return std::nullopt;
        }
        BACNET_READ_PROPERTY_DATA rpdata{};
        if (rp_ack_decode_service_request(&apdu[3], length - 3, &rpdata) <= 0) {
            return std::nullopt;
        }
        ReadPropertyAck ack;
        ack.invokeId = apdu[1];
        ack.object = ObjectId{static_cast<std::uint16_t>(rpdata.object_type), rpdata.object_instance};
        ack.property = static_cast<std::uint32_t>(rpdata.object_property);
        ack.arrayIndex = fromArrayIndex(rpdata.array_index);
        ack.value = decodeValues(rpdata.application_data, rpdata.application_data_len);
        return Message{ack};
    }
    case PDU_TYPE_ERROR: {
        if (length < 4) {
            return std::nullopt;
        }
        BACNET_ERROR_CLASS errorClass = ERROR_CLASS_SERVICES;
        BACNET_ERROR_CODE errorCode = ERROR_CODE_OTHER;
        if (bacerror_decode_error_class_and_code(&apdu[3], static_cast<unsigned>(length - 3), &errorClass,
                                                 &errorCode) <= 0) {
            return std::nullopt;
        }
        FailureReply failure;
        failure.invokeId = apdu[1];
        failure.service = apdu[2];
        failure.error =
            describeError(static_cast<std::uint32_t>(errorClass), static_cast<std::uint32_t>(errorCode));
        return Message{failure};
    }
    case PDU_TYPE_REJECT:
        if (length < 3) {
            return std::nullopt;
        }
        return Message{FailureReply{apdu[1], std::nullopt, describeReject(apdu[2])}};
    case PDU_TYPE_ABORT:
        if (length < 3) {
            return std::nullopt;
        }
        return Message{FailureReply{apdu[1], std::nullopt, describeAbort(apdu[2])}};
    default:
        return std::nullopt;
    }
}

} // namespace

Frame encodeWhoIs(const std::optional<InstanceRange> &range, bool broadcast) {
    ApduBuffer apdu{};
    const std::int32_t low = range ? static_cast<std::int32_t>(range->low) : -1;
    const std::int32_t high = range ? static_cast<std::int32_t>(range->high) : -1;
    const int length = whois_encode_apdu(apdu.data(), low, high);
    return wrapApdu(apdu.data(), length, false, broadcast);
}

Frame encodeReadProperty(std::uint8_t invokeId, const ObjectId &object, std::uint32_t property,
                         std::optional<std::uint32_t> arrayIndex) {
    BACNET_READ_PROPERTY_DATA rpdata{};
    rpdata.object_type = static_cast<BACNET_OBJECT_TYPE>(object.type);
    rpdata.object_instance = object.instance;
    rpdata.object_property = static_cast<BACNET_PROPERTY_ID>(property);
    rpdata.array_index = toArrayIndex(arrayIndex);

    ApduBuffer apdu{};
    const int length = rp_encode_apdu(apdu.data(), invokeId, &rpdata);
    return wrapApdu(apdu.data(), length, true, false);
}

Result<Frame> encodeWriteProperty(std::uint8_t invokeId, const ObjectId &object, std::uint32_t property,
                                  std::optional<std::uint32_t> arrayIndex, const PropertyValue &value,
                                  std::optional<std::uint8_t> priority) {
    if (priority && (*priority < kMinPriority || *priority > kMaxPriority)) {
        return makeError(ErrorKind::InvalidRequest, "priority must be within 1..16");
    }

    BACNET_WRITE_PROPERTY_DATA wpdata{};
    wpdata.object_type = static_cast<BACNET_OBJECT_TYPE>(object.type);
    wpdata.object_instance = object.instance;
    wpdata.object_property = static_cast<BACNET_PROPERTY_ID>(property);
    wpdata.array_index = toArrayIndex(arrayIndex);
    wpdata.priority = priority ? *priority : BACNET_NO_PRIORITY;

    auto encoded = encodeValue(value, wpdata.application_data, sizeof(wpdata.application_data));
    if (!encoded) {
        return encoded.error();
    }
    wpdata.application_data_len = encoded.value();

    ApduBuffer apdu{};
    const int length = wp_encode_apdu(apdu.data(), invokeId, &wpdata);
    auto frame = wrapApdu(apdu.data(), length, true, false);
    if (frame.empty()) {
        return makeError(ErrorKind::InvalidRequest, "write request does not fit into a single APDU");
    }
    return frame;
}

Frame encodeIAm(std::uint32_t deviceInstance, std::uint32_t maxApdu, Segmentation segmentation, std::uint16_t vendorId,
                bool broadcast) {
    ApduBuffer apdu{};
    const int length =
        iam_encode_apdu(apdu.data(), deviceInstance, maxApdu, static_cast<int>(segmentation), vendorId);
    return wrapApdu(apdu.data(), length, false, broadcast);
}

Result<Frame> encodeReadPropertyAck(std::uint8_t invokeId, const ObjectId &object, std::uint32_t property,
                                    std::optional<std::uint32_t> arrayIndex, const PropertyValue &value) {
    BACNET_READ_PROPERTY_DATA rpdata{};
    rpdata.object_type = static_cast<BACNET_OBJECT_TYPE>(object.type);
    rpdata.object_instance = object.instance;
    rpdata.object_property = static_cast<BACNET_PROPERTY_ID>(property);
    rpdata.array_index = toArrayIndex(arrayIndex);

    ApduBuffer apdu{};
    int length = rp_ack_encode_apdu_init(apdu.data(), invokeId, &rpdata);
    // Leave room for the closing tag.
    auto encoded = encodeValue(value, apdu.data() + length, apdu.size() - static_cast<std::size_t>(length) - 1U);
    if (!encoded) {
        return encoded.error();
    }
    length += encoded.value();
    length += rp_ack_encode_apdu_object_property_end(apdu.data() + length);
    return wrapApdu(apdu.data(), length, false, false);
}

Frame encodeSimpleAck(std::uint8_t invokeId, ConfirmedService service) {
    ApduBuffer apdu{};
    const int length = encode_simple_ack(apdu.data(), invokeId, static_cast<std::uint8_t>(service));
    return wrapApdu(apdu.data(), length, false, false);
}

Frame encodeErrorReply(std::uint8_t invokeId, ConfirmedService service, std::uint32_t errorClass,
                       std::uint32_t errorCode) {
    ApduBuffer apdu{};
    const int length = bacerror_encode_apdu(apdu.data(), invokeId, static_cast<BACNET_CONFIRMED_SERVICE>(service),
                                            static_cast<BACNET_ERROR_CLASS>(errorClass),
                                            static_cast<BACNET_ERROR_CODE>(errorCode));
    return wrapApdu(apdu.data(), length, false, false);
}

Frame encodeReject(std::uint8_t invokeId, std::uint8_t reason) {
    ApduBuffer apdu{};
    const int length = reject_encode_apdu(apdu.data(), invokeId, reason);
    return wrapApdu(apdu.data(), length, false, false);
}

Frame encodeAbort(std::uint8_t invokeId, std::uint8_t reason) {
    ApduBuffer apdu{};
    const int length = abort_encode_apdu(apdu.data(), invokeId, reason, true);
    return wrapApdu(apdu.data(), length, false, false);
}

std::optional<DecodedFrame> decodeFrame(const std::uint8_t *data, std::size_t length) {
    if (data == nullptr || length < kBvllHeaderLength || length > kFrameCapacity) {
        return std::nullopt;
    }
    // bacnet-stack's decoders take mutable pointers.
    std::array<std::uint8_t, kFrameCapacity> pdu{};
    std::memcpy(pdu.data(), data, length);

    std::uint8_t function = 0;
    std::uint16_t messageLength = 0;
    const int headerLength =
        bvlc_decode_header(pdu.data(), static_cast<std::uint16_t>(length), &function, &messageLength);
    if (headerLength <= 0 || messageLength > length || messageLength < kBvllHeaderLength) {
        return std::nullopt;
    }

    std::size_t offset = static_cast<std::size_t>(headerLength);
    std::optional<Ipv4Endpoint> originator;
    switch (function) {
    case BVLC_ORIGINAL_UNICAST_NPDU:
    case BVLC_ORIGINAL_BROADCAST_NPDU:
        break;
    case BVLC_FORWARDED_NPDU: {
        if (messageLength < offset + kForwardedAddressLength) {
            return std::nullopt;
        }
        const auto *addr = pdu.data() + offset;
        Ipv4Endpoint endpoint;
        endpoint.ip = (static_cast<std::uint32_t>(addr[0]) << 24U) | (static_cast<std::uint32_t>(addr[1]) << 16U) |
                      (static_cast<std::uint32_t>(addr[2]) << 8U) | static_cast<std::uint32_t>(addr[3]);
        endpoint.port = static_cast<std::uint16_t>((addr[4] << 8U) | addr[5]);
        originator = endpoint;
        offset += kForwardedAddressLength;
        break;
    }
    default:
        return std::nullopt;
    }

    BACNET_ADDRESS dest{};
    BACNET_ADDRESS src{};
    BACNET_NPDU_DATA npduData{};
    const int npduLength = bacnet_npdu_decode(pdu.data() + offset, static_cast<std::uint16_t>(messageLength - offset),
                                              &dest, &src, &npduData);
    if (npduLength <= 0 || npduData.network_layer_message || npduData.protocol_version != BACNET_PROTOCOL_VERSION) {
        return std::nullopt;
    }
    offset += static_cast<std::size_t>(npduLength);
    if (offset >= messageLength) {
        return std::nullopt;
    }

    auto message = decodeApdu(pdu.data() + offset, static_cast<int>(messageLength - offset));
    if (!message) {
        return std::nullopt;
    }
    return DecodedFrame{originator, std::move(*message)};
}

std::optional<std::uint8_t> invokeIdOf(const Message &message) {
    return std::visit(
        [](const auto &m) -> std::optional<std::uint8_t> {
            using M = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<M, IAm> || std::is_same_v<M, WhoIs>) {
                return std::nullopt;
            } else {
                return m.invokeId;
            }
        },
        message);
}

} // namespace bacproxy::codec
