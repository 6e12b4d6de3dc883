#pragma once

#include <cstdint>

#include "Outcome.h"
#include "TransactionRunner.h"

namespace application {

// Probes a range of unit ids. Units are independent and run in parallel up to the
// concurrency limit; each unit's attempts stay on one task, so a unit never has two
// requests in flight. The first exception a unit throws (normally a
// transport::TransportError) aborts the scan and is rethrown.
class ScanOrchestrator {
public:
    ScanOrchestrator(transport::Bus& bus, const protocol::IModbusCodec& codec);

    void setLogCallback(LogCallback cb);

    // Throws std::invalid_argument unless 1 <= startUnit <= endUnit <= 247.
    ScanResult scan(std::uint8_t startUnit,
                    std::uint8_t endUnit,
                    const protocol::ModbusRequest& probeTemplate,
                    unsigned concurrencyLimit,
                    const CancellationToken& cancel,
                    const OutcomeCallback& onOutcome = {});

private:
    TransactionRunner runner_;
    LogCallback onLog_;
};

} // namespace application
