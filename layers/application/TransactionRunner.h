#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include "Outcome.h"
#include "layers/protocol/IModbusCodec.h"
#include "layers/protocol/ModbusTypes.h"
#include "layers/transport/Bus.h"

namespace application {

struct TransactionResult {
    Outcome outcome = NoResponse{};
    unsigned attempts = 0;
    std::chrono::steady_clock::duration elapsed{};
    // Cancelled before reaching a terminal outcome; `outcome` is meaningless.
    bool abandoned = false;
};

// Drives one request to a terminal Outcome. Silence and unusable frames are retried
// up to `maxRetries` times; an exception response ends the transaction at once.
// On an exclusive (RTU) bus stale input is flushed before every send; on a
// multiplexed bus the wire is released after the send and the reply is matched
// by transaction id. transport::TransportError is not caught.
class TransactionRunner {
public:
    TransactionRunner(transport::Bus& bus, const protocol::IModbusCodec& codec);

    void setLogCallback(LogCallback cb);

    Outcome execute(const protocol::ModbusRequest& request);
    TransactionResult run(const protocol::ModbusRequest& request, const CancellationToken& cancel);

private:
    enum class AttemptStatus {
        Answered,
        TimedOut,
        Cancelled
    };

    AttemptStatus attempt(const protocol::ModbusRequest& request, const CancellationToken& cancel, Outcome& outcome);
    AttemptStatus attemptExclusive(const protocol::ModbusRequest& request, const CancellationToken& cancel,
                                   Outcome& outcome);
    AttemptStatus attemptRouted(const protocol::ModbusRequest& request, const CancellationToken& cancel,
                                Outcome& outcome);
    // Frames every complete reply in the bus read buffer and routes it by transaction id.
    void routeFrames(const protocol::ModbusRequest& request);
    // True if `frame` answers `expected`; invalid or unmatched frames are logged and dropped.
    bool accept(const protocol::ModbusRequest& request, const protocol::RequestFrame& expected,
                const std::vector<std::uint8_t>& frame, Outcome& outcome) const;
    void log(const std::string& message) const;

    transport::Bus& bus_;
    const protocol::IModbusCodec& codec_;
    LogCallback onLog_;
};

} // namespace application
