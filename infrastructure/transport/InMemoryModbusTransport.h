#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "layers/protocol/IModbusCodec.h"
#include "layers/transport/ITransport.h"

namespace transport {

enum class DeviceBehavior {
    Healthy,
    RegisterError,
    Silent,
    GatewayError,
    Slow,
    Flaky
};

struct SimulatedDevice {
    DeviceBehavior behavior = DeviceBehavior::Healthy;
    // Silent: the answer arrives this late (never if zero). Slow: every answer.
    // Flaky: every odd-numbered request.
    std::chrono::milliseconds delay{0};
    std::uint8_t exceptionCode = 0x02;
    std::uint16_t fillValue = 0;
    std::map<std::uint16_t, std::uint16_t> holdingRegisters;
    std::map<std::uint16_t, std::uint16_t> inputRegisters;
};

// A bus of simulated devices behind one connection. Requests are decoded with
// the framing's codec and answered, late or not at all, according to each
// device's behaviour; unknown unit ids stay silent. flushInput() drops whatever
// has already arrived and every reply a device still owes, like a gateway that
// abandons an unanswered serial exchange when the master resets the line.
class InMemoryModbusTransport final : public ITransport {
public:
    explicit InMemoryModbusTransport(ConnectionType framing = ConnectionType::Tcp,
                                     std::uint16_t firstTransactionId = 1);

    // Units 1-6: healthy, register error, silent for 2 s, gateway error,
    // 200 ms slow, and flaky (odd requests 2 s late).
    static std::unique_ptr<InMemoryModbusTransport> withReferenceDevices(ConnectionType framing);

    void addDevice(std::uint8_t unitId, SimulatedDevice device);
    void setRegister(std::uint8_t unitId, bool input, std::uint16_t address, std::uint16_t value);

    // Queues raw bytes for the next receive() after `delay`, e.g. a corrupted frame.
    // Bytes not yet due survive flushInput().
    void injectFrame(std::vector<std::uint8_t> bytes, std::chrono::milliseconds delay = std::chrono::milliseconds(0));

    // Every later send/receive throws TransportError with `reason`.
    void breakConnection(const std::string& reason);

    std::size_t requestCount(std::uint8_t unitId) const;
    std::size_t totalRequests() const;

    ConnectionType connectionType() const noexcept override;
    std::string describe() const override;

    void send(const std::vector<std::uint8_t>& data) override;
    std::optional<std::vector<std::uint8_t>> receive(std::chrono::milliseconds timeout) override;
    void flushInput() override;

    std::uint16_t nextTransactionId() override;

private:
    struct DeviceState {
        SimulatedDevice config;
        std::size_t requests = 0;
    };

    struct PendingFrame {
        std::chrono::steady_clock::time_point readyAt;
        std::vector<std::uint8_t> bytes;
        bool fromDevice = false;
    };

    protocol::ModbusResponse answer(DeviceState& device, const protocol::RequestFrame& request) const;
    void enqueue(std::vector<std::uint8_t> bytes, std::chrono::steady_clock::time_point readyAt, bool fromDevice);
    void throwIfBroken() const;

    ConnectionType framing_;
    std::unique_ptr<protocol::IModbusCodec> codec_;
    TransactionCounter transactionIds_;

    mutable std::mutex mutex_;
    std::condition_variable pendingCv_;
    std::map<std::uint8_t, DeviceState> devices_;
    std::deque<PendingFrame> pending_;
    std::map<std::uint8_t, std::size_t> requestsByUnit_;
    std::size_t totalRequests_ = 0;
    std::string brokenReason_;
};

} // namespace transport
