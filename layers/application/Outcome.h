#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace application {

struct Success {
    std::vector<std::uint8_t> rawBytes;
};

// The device answered and rejected the request.
struct DeviceError {
    std::uint8_t exceptionCode = 0;
};

// An intermediary reported that the target could not be reached.
struct GatewayError {
    std::uint8_t code = 0;
};

struct NoResponse {};

using Outcome = std::variant<Success, DeviceError, GatewayError, NoResponse>;

struct ScanResult {
    std::map<std::uint8_t, Outcome> outcomes;
    bool complete = true;
};

using LogCallback = std::function<void(const std::string&)>;
using OutcomeCallback = std::function<void(std::uint8_t unitId, const Outcome&)>;

// Cancelled when cancel() was called on it or on its parent.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(const CancellationToken* parent) : parent_(parent) {}

    void cancel() noexcept { cancelled_.store(true); }
    void reset() noexcept { cancelled_.store(false); }
    bool isCancelled() const noexcept { return cancelled_.load() || (parent_ != nullptr && parent_->isCancelled()); }

private:
    std::atomic<bool> cancelled_{false};
    const CancellationToken* parent_ = nullptr;
};

bool isDeviceFound(const Outcome& outcome);
bool isSuccess(const Outcome& outcome);

// "success", "device_error", "gateway_error" or "no_response".
std::string outcomeStatus(const Outcome& outcome);
std::string describeOutcome(const Outcome& outcome);

} // namespace application
