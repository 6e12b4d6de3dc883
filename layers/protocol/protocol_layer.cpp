#include "protocol_layer.h"

#include <cstddef>
#include <iomanip>
#include <sstream>

namespace protocol {

namespace {

constexpr std::size_t kMbapHeaderSize = 7;
constexpr std::size_t kMbapLengthOffset = 4;
constexpr std::size_t kRequestPduSize = 5;
constexpr std::size_t kCrcSize = 2;

std::uint16_t readUint16(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
    return static_cast<std::uint16_t>((bytes[offset] << 8) | bytes[offset + 1]);
}

void appendUint16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

bool isReadFunction(std::uint8_t function) {
    return function == static_cast<std::uint8_t>(FunctionCode::ReadHoldingRegisters) ||
           function == static_cast<std::uint8_t>(FunctionCode::ReadInputRegisters);
}

std::vector<std::uint8_t> createRequestPdu(const ModbusRequest& request) {
    std::vector<std::uint8_t> pdu;
    pdu.reserve(kRequestPduSize);
    pdu.push_back(functionCodeFor(request.registerType));
    appendUint16(pdu, request.startAddress);
    appendUint16(pdu, request.count);
    return pdu;
}

std::vector<std::uint8_t> createResponsePdu(const ModbusResponse& response) {
    std::vector<std::uint8_t> pdu;
    if (response.isException) {
        pdu.push_back(static_cast<std::uint8_t>(response.functionCode | kExceptionFlag));
        pdu.push_back(response.exceptionCode);
        return pdu;
    }

    pdu.reserve(2 + response.data.size());
    pdu.push_back(response.functionCode);
    pdu.push_back(static_cast<std::uint8_t>(response.data.size()));
    pdu.insert(pdu.end(), response.data.begin(), response.data.end());
    return pdu;
}

// `first`/`last` delimit the PDU inside the frame.
DecodedFrame parseResponsePdu(std::uint8_t unitId, const std::vector<std::uint8_t>& frame,
                              std::size_t first, std::size_t last) {
    if (last <= first) {
        return InvalidFrame{"Empty PDU"};
    }

    ModbusResponse response;
    response.unitId = unitId;
    const auto function = frame[first];

    if ((function & kExceptionFlag) != 0U) {
        if (last - first != 2) {
            return InvalidFrame{"Malformed exception response"};
        }
        response.functionCode = static_cast<std::uint8_t>(function & ~kExceptionFlag);
        response.isException = true;
        response.exceptionCode = frame[first + 1];
        return response;
    }

    if (!isReadFunction(function)) {
        return InvalidFrame{"Unsupported function code " + std::to_string(function)};
    }
    if (last - first < 2) {
        return InvalidFrame{"PDU too short"};
    }

    const std::size_t byteCount = frame[first + 1];
    const std::size_t available = last - first - 2;
    if (byteCount != available) {
        return InvalidFrame{"Byte count mismatch (expected " + std::to_string(byteCount) + ", got " +
                            std::to_string(available) + ")"};
    }
    if ((byteCount % 2U) != 0U) {
        return InvalidFrame{"Odd register byte count"};
    }

    response.functionCode = function;
    response.data.assign(frame.begin() + static_cast<std::ptrdiff_t>(first + 2),
                         frame.begin() + static_cast<std::ptrdiff_t>(last));
    return response;
}

bool responseFitsRequest(const ModbusResponse& response, const RequestFrame& expected) {
    if (response.unitId != expected.unitId || response.functionCode != expected.functionCode) {
        return false;
    }
    return response.isException || response.data.size() == static_cast<std::size_t>(expected.count) * 2U;
}

} // namespace

std::uint16_t crc16(const std::uint8_t* data, std::size_t size) {
    std::uint16_t crc = 0xFFFF;
    for (std::size_t i = 0; i < size; ++i) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; ++bit) {
            if ((crc & 0x01U) != 0U) {
                crc >>= 1;
                crc ^= 0xA001;
            } else {
                crc >>= 1;
            }
        }
    }
    return crc;
}

std::uint16_t crc16(const std::vector<std::uint8_t>& data) {
    return crc16(data.data(), data.size());
}

std::vector<std::uint8_t> TcpCodec::createMbapHeader(std::uint16_t transactionId, std::uint16_t length) {
    std::vector<std::uint8_t> header;
    header.reserve(6);
    appendUint16(header, transactionId);
    appendUint16(header, 0);
    appendUint16(header, length);
    return header;
}

std::vector<std::uint8_t> TcpCodec::encodeRequest(const ModbusRequest& request, std::uint16_t transactionId) const {
    const auto pdu = createRequestPdu(request);
    auto frame = createMbapHeader(transactionId, static_cast<std::uint16_t>(1 + pdu.size()));
    frame.push_back(request.unitId);
    frame.insert(frame.end(), pdu.begin(), pdu.end());
    return frame;
}

std::optional<RequestFrame> TcpCodec::decodeRequest(const std::vector<std::uint8_t>& frame) const {
    if (frame.size() != kMbapHeaderSize + kRequestPduSize) {
        return std::nullopt;
    }
    if (readUint16(frame, 2) != 0 || readUint16(frame, kMbapLengthOffset) != 1 + kRequestPduSize) {
        return std::nullopt;
    }

    RequestFrame request;
    request.transactionId = readUint16(frame, 0);
    request.unitId = frame[6];
    request.functionCode = frame[7];
    request.startAddress = readUint16(frame, 8);
    request.count = readUint16(frame, 10);
    return request;
}

std::vector<std::uint8_t> TcpCodec::encodeResponse(const ModbusResponse& response) const {
    const auto pdu = createResponsePdu(response);
    auto frame = createMbapHeader(response.transactionId, static_cast<std::uint16_t>(1 + pdu.size()));
    frame.push_back(response.unitId);
    frame.insert(frame.end(), pdu.begin(), pdu.end());
    return frame;
}

DecodedFrame TcpCodec::decodeResponse(const std::vector<std::uint8_t>& frame) const {
    if (frame.size() < kMbapHeaderSize + 2) {
        return InvalidFrame{"Response too short (TCP header)"};
    }
    if (readUint16(frame, 2) != 0) {
        return InvalidFrame{"Unexpected protocol identifier"};
    }
    const std::size_t length = readUint16(frame, kMbapLengthOffset);
    if (length + 6 != frame.size()) {
        return InvalidFrame{"MBAP length does not match frame size"};
    }

    auto decoded = parseResponsePdu(frame[6], frame, kMbapHeaderSize, frame.size());
    if (auto* response = std::get_if<ModbusResponse>(&decoded)) {
        response->transactionId = readUint16(frame, 0);
    }
    return decoded;
}

std::optional<std::size_t> TcpCodec::completeFrameLength(const std::vector<std::uint8_t>& buffer) const {
    if (buffer.size() < 6) {
        return std::nullopt;
    }
    const std::size_t length = readUint16(buffer, kMbapLengthOffset);
    if (length < 2 || length > 254) {
        // Not an MBAP header; drop everything received so far.
        return buffer.size();
    }
    if (buffer.size() < 6 + length) {
        return std::nullopt;
    }
    return 6 + length;
}

bool TcpCodec::matches(const ModbusResponse& response, const RequestFrame& expected) const {
    return response.transactionId == expected.transactionId && responseFitsRequest(response, expected);
}

void RtuCodec::appendCrc(std::vector<std::uint8_t>& frame) {
    const auto crc = crc16(frame);
    frame.push_back(static_cast<std::uint8_t>(crc & 0xFF));
    frame.push_back(static_cast<std::uint8_t>((crc >> 8) & 0xFF));
}

bool RtuCodec::validateCrc(const std::vector<std::uint8_t>& frame) {
    if (frame.size() < kCrcSize + 1) {
        return false;
    }
    const auto size = frame.size();
    const auto expected = static_cast<std::uint16_t>((frame[size - 1] << 8) | frame[size - 2]);
    return crc16(frame.data(), size - kCrcSize) == expected;
}

std::vector<std::uint8_t> RtuCodec::encodeRequest(const ModbusRequest& request, std::uint16_t) const {
    std::vector<std::uint8_t> frame;
    frame.reserve(1 + kRequestPduSize + kCrcSize);
    frame.push_back(request.unitId);
    const auto pdu = createRequestPdu(request);
    frame.insert(frame.end(), pdu.begin(), pdu.end());
    appendCrc(frame);
    return frame;
}

std::optional<RequestFrame> RtuCodec::decodeRequest(const std::vector<std::uint8_t>& frame) const {
    if (frame.size() != 1 + kRequestPduSize + kCrcSize || !validateCrc(frame)) {
        return std::nullopt;
    }

    RequestFrame request;
    request.unitId = frame[0];
    request.functionCode = frame[1];
    request.startAddress = readUint16(frame, 2);
    request.count = readUint16(frame, 4);
    return request;
}

std::vector<std::uint8_t> RtuCodec::encodeResponse(const ModbusResponse& response) const {
    std::vector<std::uint8_t> frame;
    frame.push_back(response.unitId);
    const auto pdu = createResponsePdu(response);
    frame.insert(frame.end(), pdu.begin(), pdu.end());
    appendCrc(frame);
    return frame;
}

DecodedFrame RtuCodec::decodeResponse(const std::vector<std::uint8_t>& frame) const {
    if (frame.size() < 5) {
        return InvalidFrame{"Response too short (RTU)"};
    }
    if (!validateCrc(frame)) {
        return InvalidFrame{"CRC error"};
    }
    return parseResponsePdu(frame[0], frame, 1, frame.size() - kCrcSize);
}

std::optional<std::size_t> RtuCodec::completeFrameLength(const std::vector<std::uint8_t>& buffer) const {
    if (buffer.size() < 2) {
        return std::nullopt;
    }

    const std::uint8_t function = buffer[1];
    std::size_t frameLength = 0;
    if ((function & kExceptionFlag) != 0U) {
        frameLength = 5; // unit + function + code + crc(2)
    } else if (isReadFunction(function)) {
        if (buffer.size() < 3) {
            return std::nullopt;
        }
        frameLength = 3 + buffer[2] + kCrcSize; // unit + function + byteCount + data + crc(2)
    } else {
        // Line noise: give up the first byte and resynchronise on the next one.
        return 1;
    }

    if (buffer.size() < frameLength) {
        return std::nullopt;
    }
    return frameLength;
}

bool RtuCodec::matches(const ModbusResponse& response, const RequestFrame& expected) const {
    return responseFitsRequest(response, expected);
}

std::unique_ptr<IModbusCodec> makeCodec(transport::ConnectionType connectionType) {
    if (connectionType == transport::ConnectionType::Tcp) {
        return std::make_unique<TcpCodec>();
    }
    return std::make_unique<RtuCodec>();
}

RequestFrame expectedFrame(const ModbusRequest& request, std::uint16_t transactionId) {
    RequestFrame frame;
    frame.transactionId = transactionId;
    frame.unitId = request.unitId;
    frame.functionCode = functionCodeFor(request.registerType);
    frame.startAddress = request.startAddress;
    frame.count = request.count;
    return frame;
}

std::vector<std::uint16_t> toRegisters(const std::vector<std::uint8_t>& bytes) {
    std::vector<std::uint16_t> registers;
    registers.reserve(bytes.size() / 2);
    for (std::size_t i = 0; i + 1 < bytes.size(); i += 2) {
        registers.push_back(readUint16(bytes, i));
    }
    return registers;
}

std::vector<std::uint8_t> fromRegisters(const std::vector<std::uint16_t>& registers) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(registers.size() * 2);
    for (const auto value : registers) {
        appendUint16(bytes, value);
    }
    return bytes;
}

std::string formatFrame(const std::vector<std::uint8_t>& frame) {
    std::ostringstream out;
    out << std::uppercase << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < frame.size(); ++i) {
        if (i != 0) {
            out << ' ';
        }
        out << std::setw(2) << static_cast<int>(frame[i]);
    }
    return out.str();
}

} // namespace protocol
