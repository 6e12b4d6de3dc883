#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "ModbusTypes.h"

namespace protocol {

// One framing variant of the protocol. Codecs are stateless; transaction ids are
// supplied by the caller.
class IModbusCodec {
public:
    virtual ~IModbusCodec() = default;

    virtual std::vector<std::uint8_t> encodeRequest(const ModbusRequest& request, std::uint16_t transactionId) const = 0;
    virtual std::optional<RequestFrame> decodeRequest(const std::vector<std::uint8_t>& frame) const = 0;

    virtual std::vector<std::uint8_t> encodeResponse(const ModbusResponse& response) const = 0;
    virtual DecodedFrame decodeResponse(const std::vector<std::uint8_t>& frame) const = 0;

    // Length of the first response frame at the head of `buffer`, or nullopt while
    // more bytes are needed.
    virtual std::optional<std::size_t> completeFrameLength(const std::vector<std::uint8_t>& buffer) const = 0;

    virtual bool matches(const ModbusResponse& response, const RequestFrame& expected) const = 0;
};

} // namespace protocol
