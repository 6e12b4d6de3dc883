#include <gtest/gtest.h>

#include <cstdint>
#include <variant>
#include <vector>

#include "layers/protocol/protocol_layer.h"
#include "layers/transport/ITransport.h"

using protocol::DecodedFrame;
using protocol::InvalidFrame;
using protocol::ModbusRequest;
using protocol::ModbusResponse;
using protocol::RegisterType;
using protocol::RtuCodec;
using protocol::TcpCodec;

namespace {

using Bytes = std::vector<std::uint8_t>;

ModbusRequest holdingRequest(std::uint8_t unitId, std::uint16_t address, std::uint16_t count) {
    ModbusRequest request;
    request.unitId = unitId;
    request.registerType = RegisterType::Holding;
    request.startAddress = address;
    request.count = count;
    return request;
}

const ModbusResponse& asResponse(const DecodedFrame& decoded) {
    return std::get<ModbusResponse>(decoded);
}

} // namespace

TEST(Crc16, MatchesReferenceVector) {
    const Bytes frame{0x01, 0x03, 0x00, 0x00, 0x00, 0x01};
    EXPECT_EQ(0x0A84, protocol::crc16(frame));
}

TEST(Crc16, EmptyInputIsInitialValue) {
    EXPECT_EQ(0xFFFF, protocol::crc16(Bytes{}));
}

TEST(TcpCodec, EncodesReadHoldingRequest) {
    const TcpCodec codec;
    const Bytes expected{0x00, 0x05, 0x00, 0x00, 0x00, 0x06, 0x01, 0x03, 0x00, 0x00, 0x00, 0x01};
    EXPECT_EQ(expected, codec.encodeRequest(holdingRequest(1, 0, 1), 5));
}

TEST(TcpCodec, EncodesReadInputRequest) {
    const TcpCodec codec;
    auto request = holdingRequest(0x11, 0x006B, 3);
    request.registerType = RegisterType::Input;

    const Bytes expected{0x12, 0x34, 0x00, 0x00, 0x00, 0x06, 0x11, 0x04, 0x00, 0x6B, 0x00, 0x03};
    EXPECT_EQ(expected, codec.encodeRequest(request, 0x1234));
}

TEST(TcpCodec, DecodesRegisterResponse) {
    const TcpCodec codec;
    const Bytes frame{0x00, 0x00, 0x00, 0x00, 0x00, 0x05, 0x01, 0x03, 0x02, 0x04, 0xD2};

    const auto decoded = codec.decodeResponse(frame);
    ASSERT_TRUE(std::holds_alternative<ModbusResponse>(decoded));
    const auto& response = asResponse(decoded);
    EXPECT_EQ(0, response.transactionId);
    EXPECT_EQ(1, response.unitId);
    EXPECT_EQ(0x03, response.functionCode);
    EXPECT_FALSE(response.isException);
    EXPECT_EQ((std::vector<std::uint16_t>{0x04D2}), protocol::toRegisters(response.data));
}

TEST(TcpCodec, DecodesExceptionResponse) {
    const TcpCodec codec;
    const Bytes frame{0x00, 0x00, 0x00, 0x00, 0x00, 0x03, 0x01, 0x83, 0x02};

    const auto decoded = codec.decodeResponse(frame);
    ASSERT_TRUE(std::holds_alternative<ModbusResponse>(decoded));
    const auto& response = asResponse(decoded);
    EXPECT_TRUE(response.isException);
    EXPECT_EQ(0x03, response.functionCode);
    EXPECT_EQ(0x02, response.exceptionCode);
}

TEST(TcpCodec, RejectsWrongProtocolIdentifier) {
    const TcpCodec codec;
    const Bytes frame{0x00, 0x00, 0x00, 0x01, 0x00, 0x05, 0x01, 0x03, 0x02, 0x04, 0xD2};
    ASSERT_TRUE(std::holds_alternative<InvalidFrame>(codec.decodeResponse(frame)));
}

TEST(TcpCodec, RejectsByteCountMismatch) {
    const TcpCodec codec;
    const Bytes frame{0x00, 0x00, 0x00, 0x00, 0x00, 0x05, 0x01, 0x03, 0x04, 0x04, 0xD2};
    ASSERT_TRUE(std::holds_alternative<InvalidFrame>(codec.decodeResponse(frame)));
}

TEST(TcpCodec, MatchRequiresSameTransactionId) {
    const TcpCodec codec;
    const auto request = holdingRequest(1, 0, 1);

    ModbusResponse response;
    response.transactionId = 7;
    response.unitId = 1;
    response.functionCode = 0x03;
    response.data = {0x00, 0x01};

    EXPECT_TRUE(codec.matches(response, protocol::expectedFrame(request, 7)));
    EXPECT_FALSE(codec.matches(response, protocol::expectedFrame(request, 8)));
}

TEST(TcpCodec, MatchRequiresRequestedRegisterCount) {
    const TcpCodec codec;
    const auto request = holdingRequest(1, 0, 2);

    ModbusResponse response;
    response.transactionId = 3;
    response.unitId = 1;
    response.functionCode = 0x03;
    response.data = {0x00, 0x01};

    EXPECT_FALSE(codec.matches(response, protocol::expectedFrame(request, 3)));
}

TEST(TcpCodec, FrameLengthWaitsForWholeFrame) {
    const TcpCodec codec;
    const Bytes frame{0x00, 0x09, 0x00, 0x00, 0x00, 0x05, 0x01, 0x03, 0x02, 0x04, 0xD2};

    EXPECT_FALSE(codec.completeFrameLength(Bytes(frame.begin(), frame.begin() + 4)).has_value());
    EXPECT_FALSE(codec.completeFrameLength(Bytes(frame.begin(), frame.begin() + 9)).has_value());

    Bytes twoFrames = frame;
    twoFrames.insert(twoFrames.end(), frame.begin(), frame.end());
    const auto length = codec.completeFrameLength(twoFrames);
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(frame.size(), *length);
}

TEST(TcpCodec, RequestRoundTrip) {
    const TcpCodec codec;
    const auto decoded = codec.decodeRequest(codec.encodeRequest(holdingRequest(42, 0x0100, 10), 0xBEEF));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(0xBEEF, decoded->transactionId);
    EXPECT_EQ(42, decoded->unitId);
    EXPECT_EQ(0x03, decoded->functionCode);
    EXPECT_EQ(0x0100, decoded->startAddress);
    EXPECT_EQ(10, decoded->count);
}

TEST(RtuCodec, EncodesRequestWithCrc) {
    const RtuCodec codec;
    const Bytes expected{0x01, 0x03, 0x00, 0x00, 0x00, 0x01, 0x84, 0x0A};
    EXPECT_EQ(expected, codec.encodeRequest(holdingRequest(1, 0, 1), 0));
}

TEST(RtuCodec, DecodesRegisterResponse) {
    const RtuCodec codec;
    const Bytes frame{0x01, 0x03, 0x02, 0x04, 0xD2, 0x3A, 0xD9};

    const auto decoded = codec.decodeResponse(frame);
    ASSERT_TRUE(std::holds_alternative<ModbusResponse>(decoded));
    const auto& response = asResponse(decoded);
    EXPECT_EQ(1, response.unitId);
    EXPECT_EQ((std::vector<std::uint16_t>{0x04D2}), protocol::toRegisters(response.data));
}

TEST(RtuCodec, BadCrcIsInvalidFrame) {
    const RtuCodec codec;
    const Bytes frame{0x01, 0x03, 0x02, 0x04, 0xD2, 0xFF, 0xFF};

    const auto decoded = codec.decodeResponse(frame);
    ASSERT_TRUE(std::holds_alternative<InvalidFrame>(decoded));
    EXPECT_EQ("CRC error", std::get<InvalidFrame>(decoded).reason);
}

TEST(RtuCodec, DecodesExceptionResponse) {
    const RtuCodec codec;
    const Bytes frame{0x06, 0x83, 0x02, 0x71, 0x30};

    const auto decoded = codec.decodeResponse(frame);
    ASSERT_TRUE(std::holds_alternative<ModbusResponse>(decoded));
    EXPECT_TRUE(asResponse(decoded).isException);
    EXPECT_EQ(0x02, asResponse(decoded).exceptionCode);
}

TEST(RtuCodec, RequestRoundTripRecoversFields) {
    const RtuCodec codec;
    auto request = holdingRequest(17, 0x1234, 125);
    request.registerType = RegisterType::Input;

    const auto decoded = codec.decodeRequest(codec.encodeRequest(request, 0));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(17, decoded->unitId);
    EXPECT_EQ(0x04, decoded->functionCode);
    EXPECT_EQ(0x1234, decoded->startAddress);
    EXPECT_EQ(125, decoded->count);
}

TEST(RtuCodec, CorruptingAnyPayloadByteFailsCrc) {
    const RtuCodec codec;
    const auto frame = codec.encodeRequest(holdingRequest(3, 0x0010, 2), 0);

    for (std::size_t i = 0; i + 2 < frame.size(); ++i) {
        auto corrupted = frame;
        corrupted[i] ^= 0x5A;
        EXPECT_FALSE(codec.decodeRequest(corrupted).has_value()) << "byte " << i;
    }
}

TEST(RtuCodec, ResponseRoundTrip) {
    const RtuCodec codec;
    ModbusResponse response;
    response.unitId = 9;
    response.functionCode = 0x04;
    response.data = protocol::fromRegisters({0x0102, 0xFFFE});

    const auto decoded = codec.decodeResponse(codec.encodeResponse(response));
    ASSERT_TRUE(std::holds_alternative<ModbusResponse>(decoded));
    EXPECT_EQ(response.data, asResponse(decoded).data);
    EXPECT_EQ(0x04, asResponse(decoded).functionCode);
}

TEST(RtuCodec, FrameLengthFromByteCount) {
    const RtuCodec codec;
    const Bytes frame{0x01, 0x03, 0x02, 0x04, 0xD2, 0x3A, 0xD9};

    EXPECT_FALSE(codec.completeFrameLength(Bytes{0x01}).has_value());
    EXPECT_FALSE(codec.completeFrameLength(Bytes(frame.begin(), frame.begin() + 5)).has_value());
    ASSERT_TRUE(codec.completeFrameLength(frame).has_value());
    EXPECT_EQ(7U, *codec.completeFrameLength(frame));

    const auto exception = codec.completeFrameLength(Bytes{0x06, 0x83, 0x02, 0x71, 0x30});
    ASSERT_TRUE(exception.has_value());
    EXPECT_EQ(5U, *exception);
}

TEST(RtuCodec, FrameLengthSkipsLineNoise) {
    const RtuCodec codec;
    const auto length = codec.completeFrameLength(Bytes{0x00, 0x55, 0x01, 0x03});
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(1U, *length);
}

TEST(RtuCodec, MatchRequiresUnitAndFunction) {
    const RtuCodec codec;
    const auto request = holdingRequest(5, 0, 1);

    ModbusResponse response;
    response.unitId = 5;
    response.functionCode = 0x03;
    response.data = {0x00, 0x01};
    EXPECT_TRUE(codec.matches(response, protocol::expectedFrame(request, 0)));

    response.unitId = 6;
    EXPECT_FALSE(codec.matches(response, protocol::expectedFrame(request, 0)));

    response.unitId = 5;
    response.functionCode = 0x04;
    EXPECT_FALSE(codec.matches(response, protocol::expectedFrame(request, 0)));
}

TEST(MakeCodec, SelectsFramingByConnectionType) {
    EXPECT_NE(nullptr, dynamic_cast<TcpCodec*>(protocol::makeCodec(transport::ConnectionType::Tcp).get()));
    EXPECT_NE(nullptr, dynamic_cast<RtuCodec*>(protocol::makeCodec(transport::ConnectionType::Rtu).get()));
    EXPECT_NE(nullptr, dynamic_cast<RtuCodec*>(protocol::makeCodec(transport::ConnectionType::RtuOverTcp).get()));
}

TEST(TransactionCounter, WrapsAtSixteenBits) {
    transport::TransactionCounter counter(0xFFFE);
    EXPECT_EQ(0xFFFE, counter.next());
    EXPECT_EQ(0xFFFF, counter.next());
    EXPECT_EQ(0x0000, counter.next());
    EXPECT_EQ(0x0001, counter.next());
}

TEST(FormatFrame, RendersSpacedHex) {
    EXPECT_EQ("01 03 0A FF", protocol::formatFrame(Bytes{0x01, 0x03, 0x0A, 0xFF}));
    EXPECT_EQ("", protocol::formatFrame(Bytes{}));
}
