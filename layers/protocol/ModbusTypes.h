#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace protocol {

enum class RegisterType {
    Holding,
    Input
};

enum class FunctionCode : std::uint8_t {
    ReadHoldingRegisters = 0x03,
    ReadInputRegisters = 0x04
};

constexpr std::uint8_t kExceptionFlag = 0x80;
constexpr std::uint8_t kMinUnitId = 1;
constexpr std::uint8_t kMaxUnitId = 247;
constexpr std::uint16_t kMaxReadCount = 125;

// Exception codes reported by an intermediary rather than the addressed device.
constexpr std::uint8_t kGatewayPathUnavailable = 0x0A;
constexpr std::uint8_t kGatewayTargetFailedToRespond = 0x0B;

struct ModbusRequest {
    std::uint8_t unitId = 1;
    RegisterType registerType = RegisterType::Holding;
    std::uint16_t startAddress = 0;
    std::uint16_t count = 1;
    std::chrono::milliseconds timeout{3000};
    unsigned maxRetries = 0;
};

// What a request looks like on the wire once encoded.
struct RequestFrame {
    std::uint16_t transactionId = 0;
    std::uint8_t unitId = 0;
    std::uint8_t functionCode = 0;
    std::uint16_t startAddress = 0;
    std::uint16_t count = 0;
};

struct ModbusResponse {
    std::uint16_t transactionId = 0;
    std::uint8_t unitId = 0;
    std::uint8_t functionCode = 0;
    bool isException = false;
    std::uint8_t exceptionCode = 0;
    std::vector<std::uint8_t> data;
};

struct InvalidFrame {
    std::string reason;
};

using DecodedFrame = std::variant<ModbusResponse, InvalidFrame>;

inline std::uint8_t functionCodeFor(RegisterType type) {
    return static_cast<std::uint8_t>(type == RegisterType::Input ? FunctionCode::ReadInputRegisters
                                                                 : FunctionCode::ReadHoldingRegisters);
}

inline bool isGatewayException(std::uint8_t exceptionCode) {
    return exceptionCode == kGatewayPathUnavailable || exceptionCode == kGatewayTargetFailedToRespond;
}

} // namespace protocol
