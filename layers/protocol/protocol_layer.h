#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "IModbusCodec.h"
#include "ModbusTypes.h"
#include "layers/transport/ITransport.h"

namespace protocol {

// CRC-16/MODBUS: reflected polynomial 0xA001, initial value 0xFFFF.
std::uint16_t crc16(const std::uint8_t* data, std::size_t size);
std::uint16_t crc16(const std::vector<std::uint8_t>& data);

// MBAP-framed variant: transaction id, protocol id 0, length, unit id, PDU.
class TcpCodec final : public IModbusCodec {
public:
    std::vector<std::uint8_t> encodeRequest(const ModbusRequest& request, std::uint16_t transactionId) const override;
    std::optional<RequestFrame> decodeRequest(const std::vector<std::uint8_t>& frame) const override;

    std::vector<std::uint8_t> encodeResponse(const ModbusResponse& response) const override;
    DecodedFrame decodeResponse(const std::vector<std::uint8_t>& frame) const override;

    std::optional<std::size_t> completeFrameLength(const std::vector<std::uint8_t>& buffer) const override;
    bool matches(const ModbusResponse& response, const RequestFrame& expected) const override;

private:
    static std::vector<std::uint8_t> createMbapHeader(std::uint16_t transactionId, std::uint16_t length);
};

// Serial-line variant: unit id, PDU, CRC-16 low byte first. Also carried over TCP
// sockets by serial gateways.
class RtuCodec final : public IModbusCodec {
public:
    std::vector<std::uint8_t> encodeRequest(const ModbusRequest& request, std::uint16_t transactionId) const override;
    std::optional<RequestFrame> decodeRequest(const std::vector<std::uint8_t>& frame) const override;

    std::vector<std::uint8_t> encodeResponse(const ModbusResponse& response) const override;
    DecodedFrame decodeResponse(const std::vector<std::uint8_t>& frame) const override;

    std::optional<std::size_t> completeFrameLength(const std::vector<std::uint8_t>& buffer) const override;
    bool matches(const ModbusResponse& response, const RequestFrame& expected) const override;

private:
    static void appendCrc(std::vector<std::uint8_t>& frame);
    static bool validateCrc(const std::vector<std::uint8_t>& frame);
};

std::unique_ptr<IModbusCodec> makeCodec(transport::ConnectionType connectionType);

RequestFrame expectedFrame(const ModbusRequest& request, std::uint16_t transactionId);

std::vector<std::uint16_t> toRegisters(const std::vector<std::uint8_t>& bytes);
std::vector<std::uint8_t> fromRegisters(const std::vector<std::uint16_t>& registers);

std::string formatFrame(const std::vector<std::uint8_t>& frame);

} // namespace protocol
