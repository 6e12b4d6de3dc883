#include "InMemoryModbusTransport.h"

#include <algorithm>

#include "layers/protocol/protocol_layer.h"

namespace transport {

InMemoryModbusTransport::InMemoryModbusTransport(ConnectionType framing, std::uint16_t firstTransactionId)
    : framing_(framing),
      codec_(protocol::makeCodec(framing)),
      transactionIds_(firstTransactionId) {}

std::unique_ptr<InMemoryModbusTransport> InMemoryModbusTransport::withReferenceDevices(ConnectionType framing) {
    using std::chrono::milliseconds;

    auto bus = std::make_unique<InMemoryModbusTransport>(framing);

    SimulatedDevice healthy;
    healthy.fillValue = 1111;
    bus->addDevice(1, healthy);

    SimulatedDevice registerError;
    registerError.behavior = DeviceBehavior::RegisterError;
    registerError.exceptionCode = 0x02;
    bus->addDevice(2, registerError);

    SimulatedDevice silent;
    silent.behavior = DeviceBehavior::Silent;
    silent.delay = milliseconds(2000);
    silent.fillValue = 3333;
    bus->addDevice(3, silent);

    SimulatedDevice gatewayError;
    gatewayError.behavior = DeviceBehavior::GatewayError;
    gatewayError.exceptionCode = protocol::kGatewayTargetFailedToRespond;
    bus->addDevice(4, gatewayError);

    SimulatedDevice slow;
    slow.behavior = DeviceBehavior::Slow;
    slow.delay = milliseconds(200);
    slow.fillValue = 5555;
    bus->addDevice(5, slow);

    SimulatedDevice flaky;
    flaky.behavior = DeviceBehavior::Flaky;
    flaky.delay = milliseconds(2000);
    flaky.fillValue = 123;
    bus->addDevice(6, flaky);

    return bus;
}

void InMemoryModbusTransport::addDevice(std::uint8_t unitId, SimulatedDevice device) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[unitId] = DeviceState{std::move(device), 0};
}

void InMemoryModbusTransport::setRegister(std::uint8_t unitId, bool input, std::uint16_t address, std::uint16_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& config = devices_[unitId].config;
    (input ? config.inputRegisters : config.holdingRegisters)[address] = value;
}

void InMemoryModbusTransport::injectFrame(std::vector<std::uint8_t> bytes, std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    enqueue(std::move(bytes), std::chrono::steady_clock::now() + delay, false);
}

void InMemoryModbusTransport::breakConnection(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        brokenReason_ = reason.empty() ? "Connection lost" : reason;
    }
    pendingCv_.notify_all();
}

std::size_t InMemoryModbusTransport::requestCount(std::uint8_t unitId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requestsByUnit_.find(unitId);
    return it == requestsByUnit_.end() ? 0 : it->second;
}

std::size_t InMemoryModbusTransport::totalRequests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalRequests_;
}

ConnectionType InMemoryModbusTransport::connectionType() const noexcept { return framing_; }

std::string InMemoryModbusTransport::describe() const {
    switch (framing_) {
        case ConnectionType::Tcp:
            return "simulated:tcp";
        case ConnectionType::Rtu:
            return "simulated:rtu";
        case ConnectionType::RtuOverTcp:
            return "simulated:rtu-over-tcp";
    }
    return "simulated";
}

std::uint16_t InMemoryModbusTransport::nextTransactionId() { return transactionIds_.next(); }

void InMemoryModbusTransport::send(const std::vector<std::uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfBroken();
    ++totalRequests_;

    const auto request = codec_->decodeRequest(data);
    if (!request) {
        // A garbled request reaches nobody.
        return;
    }
    ++requestsByUnit_[request->unitId];

    auto it = devices_.find(request->unitId);
    if (it == devices_.end()) {
        return;
    }

    auto& device = it->second;
    ++device.requests;

    const auto now = std::chrono::steady_clock::now();
    auto readyAt = now;
    switch (device.config.behavior) {
        case DeviceBehavior::Silent:
            if (device.config.delay.count() == 0) {
                return;
            }
            readyAt += device.config.delay;
            break;
        case DeviceBehavior::Slow:
            readyAt += device.config.delay;
            break;
        case DeviceBehavior::Flaky:
            if (device.requests % 2 != 0) {
                readyAt += device.config.delay;
            }
            break;
        default:
            break;
    }

    enqueue(codec_->encodeResponse(answer(device, *request)), readyAt, true);
}

std::optional<std::vector<std::uint8_t>> InMemoryModbusTransport::receive(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        throwIfBroken();
        const auto now = std::chrono::steady_clock::now();
        if (!pending_.empty() && pending_.front().readyAt <= now) {
            auto bytes = std::move(pending_.front().bytes);
            pending_.pop_front();
            return bytes;
        }
        if (now >= deadline) {
            return std::nullopt;
        }

        auto wakeAt = deadline;
        if (!pending_.empty()) {
            wakeAt = std::min(wakeAt, pending_.front().readyAt);
        }
        pendingCv_.wait_until(lock, wakeAt);
    }
}

void InMemoryModbusTransport::flushInput() {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfBroken();
    const auto now = std::chrono::steady_clock::now();
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [now](const PendingFrame& frame) { return frame.fromDevice || frame.readyAt <= now; }),
                   pending_.end());
}

protocol::ModbusResponse InMemoryModbusTransport::answer(DeviceState& device,
                                                         const protocol::RequestFrame& request) const {
    protocol::ModbusResponse response;
    response.transactionId = request.transactionId;
    response.unitId = request.unitId;
    response.functionCode = request.functionCode;

    const auto behavior = device.config.behavior;
    if (behavior == DeviceBehavior::RegisterError || behavior == DeviceBehavior::GatewayError) {
        response.isException = true;
        response.exceptionCode = device.config.exceptionCode;
        return response;
    }

    const bool input = request.functionCode == static_cast<std::uint8_t>(protocol::FunctionCode::ReadInputRegisters);
    const auto& registers = input ? device.config.inputRegisters : device.config.holdingRegisters;

    std::vector<std::uint16_t> values;
    values.reserve(request.count);
    for (std::uint32_t offset = 0; offset < request.count; ++offset) {
        const auto address = static_cast<std::uint16_t>(request.startAddress + offset);
        auto it = registers.find(address);
        values.push_back(it == registers.end() ? device.config.fillValue : it->second);
    }
    response.data = protocol::fromRegisters(values);
    return response;
}

void InMemoryModbusTransport::enqueue(std::vector<std::uint8_t> bytes,
                                      std::chrono::steady_clock::time_point readyAt,
                                      bool fromDevice) {
    const auto position = std::upper_bound(pending_.begin(), pending_.end(), readyAt,
        [](const auto& when, const PendingFrame& frame) { return when < frame.readyAt; });
    pending_.insert(position, PendingFrame{readyAt, std::move(bytes), fromDevice});
    pendingCv_.notify_all();
}

void InMemoryModbusTransport::throwIfBroken() const {
    if (!brokenReason_.empty()) {
        throw TransportError(brokenReason_);
    }
}

} // namespace transport
