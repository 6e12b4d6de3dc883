#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace transport {

enum class ConnectionType {
    Tcp,
    Rtu,
    RtuOverTcp
};

using ErrorCallback = std::function<void(const std::string&)>;

// Connection-level failure: the link is broken, not the addressed device.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Monotonic 16-bit transaction id source, one per transport instance.
class TransactionCounter {
public:
    explicit TransactionCounter(std::uint16_t first = 1) : next_(first) {}

    std::uint16_t next() noexcept { return next_.fetch_add(1); }

private:
    std::atomic<std::uint16_t> next_;
};

class ITransport {
public:
    virtual ~ITransport() = default;

    virtual ConnectionType connectionType() const noexcept = 0;
    virtual std::string describe() const = 0;

    // Both throw TransportError when the connection is unusable.
    virtual void send(const std::vector<std::uint8_t>& data) = 0;
    virtual std::optional<std::vector<std::uint8_t>> receive(std::chrono::milliseconds timeout) = 0;
    // Drops input that arrived but was never read, e.g. a late reply to an earlier attempt.
    virtual void flushInput() = 0;

    virtual std::uint16_t nextTransactionId() = 0;
};

} // namespace transport
