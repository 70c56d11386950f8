#include "bacnet_codec.h"

#include "support/simulated_network.h"

#include <gtest/gtest.h>

using namespace bacproxy;

namespace {

codec::Message decode(const codec::Frame &frame) {
    auto decoded = codec::decodeFrame(frame.data(), frame.size());
    EXPECT_TRUE(decoded.has_value());
    return decoded ? decoded->message : codec::Message{codec::WhoIs{}};
}

// BVLL header (4) + NPDU without routing information (2).
constexpr std::size_t kApduOffset = 6;

} // namespace

TEST(BacnetCodec, WhoIsFramesUseBroadcastOrUnicastBvll) {
    const auto broadcast = codec::encodeWhoIs(std::nullopt, true);
    ASSERT_GE(broadcast.size(), 4U);
    EXPECT_EQ(broadcast[0], 0x81);
    EXPECT_EQ(broadcast[1], 0x0B);
    EXPECT_EQ((broadcast[2] << 8) | broadcast[3], static_cast<int>(broadcast.size()));

    const auto unicast = codec::encodeWhoIs(std::nullopt, false);
    ASSERT_GE(unicast.size(), 4U);
    EXPECT_EQ(unicast[1], 0x0A);
}

TEST(BacnetCodec, WhoIsCarriesOptionalLimits) {
    const auto open = std::get<codec::WhoIs>(decode(codec::encodeWhoIs(std::nullopt, true)));
    EXPECT_FALSE(open.range.has_value());

    const auto limited = std::get<codec::WhoIs>(decode(codec::encodeWhoIs(InstanceRange{100, 250}, true)));
    ASSERT_TRUE(limited.range.has_value());
    EXPECT_EQ(limited.range->low, 100U);
    EXPECT_EQ(limited.range->high, 250U);
}

TEST(BacnetCodec, IAmFields) {
    const auto frame = codec::encodeIAm(4194302, 1476, Segmentation::Both, 260, true);
    auto decoded = codec::decodeFrame(frame.data(), frame.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->originator.has_value());
    const auto &iam = std::get<codec::IAm>(decoded->message);
    EXPECT_EQ(iam.deviceInstance, 4194302U);
    EXPECT_EQ(iam.maxApdu, 1476U);
    EXPECT_EQ(iam.segmentation, Segmentation::Both);
    EXPECT_EQ(iam.vendorId, 260);
    EXPECT_FALSE(codec::invokeIdOf(decoded->message).has_value());
}

TEST(BacnetCodec, ForwardedNpduReportsOriginator) {
    const auto original = codec::encodeIAm(77, 480, Segmentation::None, 8, true);
    codec::Frame forwarded{0x81, 0x04, 0x00, 0x00, 192, 168, 9, 20, 0xBA, 0xC1};
    forwarded.insert(forwarded.end(), original.begin() + 4, original.end());
    forwarded[2] = static_cast<std::uint8_t>(forwarded.size() >> 8);
    forwarded[3] = static_cast<std::uint8_t>(forwarded.size() & 0xFF);

    auto decoded = codec::decodeFrame(forwarded.data(), forwarded.size());
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->originator.has_value());
    EXPECT_EQ(formatDeviceAddress(*decoded->originator), "192.168.9.20:47809");
    EXPECT_EQ(std::get<codec::IAm>(decoded->message).deviceInstance, 77U);
}

TEST(BacnetCodec, ReadPropertyRequest) {
    const ObjectId object{object_type::kAnalogInput, 3};
    const auto request = std::get<codec::ReadPropertyRequest>(
        decode(codec::encodeReadProperty(42, object, property_id::kObjectList, 5U)));
    EXPECT_EQ(request.invokeId, 42);
    EXPECT_EQ(request.object, object);
    EXPECT_EQ(request.property, property_id::kObjectList);
    ASSERT_TRUE(request.arrayIndex.has_value());
    EXPECT_EQ(*request.arrayIndex, 5U);

    const auto whole = std::get<codec::ReadPropertyRequest>(
        decode(codec::encodeReadProperty(1, object, property_id::kPresentValue, std::nullopt)));
    EXPECT_FALSE(whole.arrayIndex.has_value());
}

TEST(BacnetCodec, WritePropertyWithPriority) {
    const ObjectId object{object_type::kAnalogValue, 1};
    auto frame = codec::encodeWriteProperty(9, object, property_id::kPresentValue, std::nullopt,
                                            PrimitiveValue{21.5F}, 8);
    ASSERT_TRUE(frame);
    const auto request = std::get<codec::WritePropertyRequest>(decode(frame.value()));
    EXPECT_EQ(request.invokeId, 9);
    EXPECT_EQ(request.object, object);
    EXPECT_EQ(request.priority, 8);
    const auto &value = std::get<PrimitiveValue>(request.value);
    EXPECT_FLOAT_EQ(std::get<float>(value), 21.5F);
}

TEST(BacnetCodec, WritePropertyWithoutPriorityMeansLowest) {
    auto frame = codec::encodeWriteProperty(2, ObjectId{object_type::kBinaryValue, 4}, property_id::kPresentValue,
                                            std::nullopt, PrimitiveValue{Enumerated{1}}, std::nullopt);
    ASSERT_TRUE(frame);
    const auto request = std::get<codec::WritePropertyRequest>(decode(frame.value()));
    EXPECT_EQ(request.priority, kMaxPriority);
    EXPECT_EQ(std::get<Enumerated>(std::get<PrimitiveValue>(request.value)).value, 1U);
}

TEST(BacnetCodec, RelinquishIsNull) {
    auto frame = codec::encodeWriteProperty(3, ObjectId{object_type::kAnalogOutput, 0}, property_id::kPresentValue,
                                            std::nullopt, PrimitiveValue{}, 8);
    ASSERT_TRUE(frame);
    const auto request = std::get<codec::WritePropertyRequest>(decode(frame.value()));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(std::get<PrimitiveValue>(request.value)));
}

TEST(BacnetCodec, WritePropertyRejectsBadPriority) {
    const ObjectId object{object_type::kAnalogValue, 1};
    for (const std::uint8_t priority : {std::uint8_t{0}, std::uint8_t{17}}) {
        auto frame = codec::encodeWriteProperty(1, object, property_id::kPresentValue, std::nullopt,
                                                PrimitiveValue{1.0F}, priority);
        ASSERT_FALSE(frame);
        EXPECT_EQ(frame.error().kind, ErrorKind::InvalidRequest);
    }
}

TEST(BacnetCodec, WritePropertyRejectsOutOfRangeValues) {
    auto frame = codec::encodeWriteProperty(1, ObjectId{object_type::kAnalogValue, 1}, property_id::kPresentValue,
                                            std::nullopt, PrimitiveValue{std::int64_t{1} << 40}, std::nullopt);
    ASSERT_FALSE(frame);
    EXPECT_EQ(frame.error().kind, ErrorKind::InvalidRequest);
}

TEST(BacnetCodec, ReadPropertyAckWithList) {
    const ObjectId device{object_type::kDevice, 1234};
    const ValueList objects{PrimitiveValue{device}, PrimitiveValue{ObjectId{object_type::kAnalogInput, 0}},
                            PrimitiveValue{ObjectId{object_type::kBinaryValue, 7}}};
    auto frame = codec::encodeReadPropertyAck(17, device, property_id::kObjectList, std::nullopt, objects);
    ASSERT_TRUE(frame);

    const auto ack = std::get<codec::ReadPropertyAck>(decode(frame.value()));
    EXPECT_EQ(ack.invokeId, 17);
    EXPECT_EQ(ack.object, device);
    EXPECT_EQ(ack.property, property_id::kObjectList);
    const auto &list = std::get<ValueList>(ack.value);
    ASSERT_EQ(list.size(), 3U);
    EXPECT_EQ(std::get<ObjectId>(list[2]), (ObjectId{object_type::kBinaryValue, 7}));
}

TEST(BacnetCodec, ReadPropertyAckPrimitiveTypes) {
    const ObjectId object{object_type::kAnalogInput, 1};
    const std::vector<PrimitiveValue> samples{
        PrimitiveValue{std::string("Zone Temp")},
        PrimitiveValue{std::uint64_t{62}},
        PrimitiveValue{std::int64_t{-40}},
        PrimitiveValue{true},
        PrimitiveValue{BitString{false, true, false, false}},
        PrimitiveValue{Date{2024, 5, 17, 5}},
        PrimitiveValue{Time{13, 45, 30, 0}},
        PrimitiveValue{OctetString{0xDE, 0xAD}},
    };
    for (const auto &sample : samples) {
        auto frame = codec::encodeReadPropertyAck(1, object, property_id::kPresentValue, std::nullopt, sample);
        ASSERT_TRUE(frame);
        const auto ack = std::get<codec::ReadPropertyAck>(decode(frame.value()));
        EXPECT_EQ(std::get<PrimitiveValue>(ack.value), sample) << describeValue(sample);
    }
}

TEST(BacnetCodec, ErrorReply) {
    const auto frame = codec::encodeErrorReply(5, codec::ConfirmedService::ReadProperty, test::kErrorClassProperty,
                                               test::kErrorUnknownProperty);
    const auto failure = std::get<codec::FailureReply>(decode(frame));
    EXPECT_EQ(failure.invokeId, 5);
    ASSERT_TRUE(failure.service.has_value());
    EXPECT_EQ(*failure.service, static_cast<std::uint8_t>(codec::ConfirmedService::ReadProperty));
    EXPECT_EQ(failure.error.source, RemoteError::Source::Error);
    EXPECT_EQ(failure.error.errorClass, test::kErrorClassProperty);
    EXPECT_EQ(failure.error.errorCode, test::kErrorUnknownProperty);
    EXPECT_FALSE(failure.error.description.empty());
}

TEST(BacnetCodec, RejectAndAbort) {
    const auto reject = std::get<codec::FailureReply>(decode(codec::encodeReject(6, 4)));
    EXPECT_EQ(reject.invokeId, 6);
    EXPECT_FALSE(reject.service.has_value());
    EXPECT_EQ(reject.error.source, RemoteError::Source::Reject);
    EXPECT_EQ(reject.error.errorCode, 4U);

    const auto abort = std::get<codec::FailureReply>(decode(codec::encodeAbort(7, test::kAbortSegmentationNotSupported)));
    EXPECT_EQ(abort.invokeId, 7);
    EXPECT_EQ(abort.error.source, RemoteError::Source::Abort);
    EXPECT_EQ(abort.error.errorCode, test::kAbortSegmentationNotSupported);
}

TEST(BacnetCodec, SimpleAck) {
    const auto ack = std::get<codec::SimpleAck>(decode(codec::encodeSimpleAck(8, codec::ConfirmedService::WriteProperty)));
    EXPECT_EQ(ack.invokeId, 8);
    EXPECT_EQ(ack.service, static_cast<std::uint8_t>(codec::ConfirmedService::WriteProperty));
    EXPECT_EQ(codec::invokeIdOf(codec::Message{ack}), std::optional<std::uint8_t>(8));
}

TEST(BacnetCodec, SegmentedAckIsReportedAsAbort) {
    auto frame = codec::encodeReadPropertyAck(11, ObjectId{object_type::kDevice, 1}, property_id::kObjectName,
                                              std::nullopt, PrimitiveValue{std::string("dev")});
    ASSERT_TRUE(frame);
    auto bytes = frame.value();
    ASSERT_GT(bytes.size(), kApduOffset);
    ASSERT_EQ(bytes[kApduOffset] & 0xF0, 0x30);
    bytes[kApduOffset] |= 0x08;

    const auto failure = std::get<codec::FailureReply>(decode(bytes));
    EXPECT_EQ(failure.invokeId, 11);
    EXPECT_EQ(failure.error.source, RemoteError::Source::Abort);
    EXPECT_EQ(failure.error.errorCode, test::kAbortSegmentationNotSupported);
}

TEST(BacnetCodec, RejectsGarbage) {
    const codec::Frame empty;
    EXPECT_FALSE(codec::decodeFrame(empty.data(), empty.size()).has_value());

    const codec::Frame notBacnet{0x45, 0x00, 0x00, 0x08, 0x01, 0x02, 0x03, 0x04};
    EXPECT_FALSE(codec::decodeFrame(notBacnet.data(), notBacnet.size()).has_value());

    auto truncated = codec::encodeIAm(1, 480, Segmentation::None, 1, true);
    truncated.resize(truncated.size() - 3);
    EXPECT_FALSE(codec::decodeFrame(truncated.data(), truncated.size()).has_value());

    const codec::Frame headerOnly{0x81, 0x0A, 0x00, 0x04};
    EXPECT_FALSE(codec::decodeFrame(headerOnly.data(), headerOnly.size()).has_value());
}
