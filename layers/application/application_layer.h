#pragma once

#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "DeviceManager.h"
#include "Outcome.h"
#include "layers/protocol/IModbusCodec.h"
#include "layers/protocol/ValueDecoder.h"
#include "layers/transport/Bus.h"
#include "layers/transport/transport_layer.h"

namespace application {

struct TransportConfig {
    transport::ConnectionType type = transport::ConnectionType::Tcp;
    std::string host;
    std::uint16_t port = 0;
    transport::SerialSettings serial;
    bool simulated = false;
    bool active = false;
    std::string description;
};

struct ScanSettings {
    std::uint8_t startUnit = 1;
    std::uint8_t endUnit = protocol::kMaxUnitId;
    double timeoutSeconds = 3.0;
    unsigned retries = 0;
    std::uint16_t address = 0;
    protocol::RegisterType registerType = protocol::RegisterType::Holding;
    unsigned concurrency = 1;
};

struct ReadSettings {
    std::uint8_t unitId = 1;
    protocol::RegisterType registerType = protocol::RegisterType::Holding;
    std::uint16_t address = 0;
    std::uint16_t count = 1;
    // Empty: every supported format.
    std::vector<protocol::ValueFormat> formats;
    double timeoutSeconds = 3.0;
    unsigned retries = 0;
};

struct ReadResult {
    Outcome outcome = NoResponse{};
    unsigned attempts = 0;
    std::vector<std::uint16_t> registers;
    protocol::DecodeReport decoded;
};

// Owns the connection and runs scans and reads on it. Failures are reported as
// `false` plus a message; a transport failure also closes the connection.
class ApplicationCore {
public:
    ApplicationCore() = default;

    ApplicationCore(const ApplicationCore&) = delete;
    ApplicationCore& operator=(const ApplicationCore&) = delete;

    void setLogCallback(LogCallback cb);
    // Per-attempt lines from the transaction runner ("Unit 3: Attempt 1/2", ...).
    void setTraceCallback(LogCallback cb);
    void setErrorCallback(transport::ErrorCallback cb);

    bool openTcpTransport(const std::string& host, std::uint16_t port, bool rtuOverTcp, std::string& error,
                          std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(3000));
    bool openRtuTransport(const transport::SerialSettings& settings, std::string& error);
    bool openSimulatedTransport(transport::ConnectionType framing, std::string& error);
    void attachTransport(std::unique_ptr<transport::ITransport> transport, TransportConfig config);
    bool closeActiveTransport(boost::json::object& closedInfo);
    TransportConfig transportStatus() const;
    std::vector<std::string> listSerialPorts() const;

    // `interrupt`, when given, cancels the scan like cancelScan() does, including a
    // cancellation raised before the scan starts.
    bool scanDevices(const ScanSettings& settings, ScanResult& result, std::string& error,
                     const OutcomeCallback& onOutcome = {}, const CancellationToken* interrupt = nullptr);
    bool cancelScan();
    bool scanInProgress() const noexcept { return scanning_.load(); }

    bool readRegister(const ReadSettings& settings, ReadResult& result, std::string& error);

    DeviceManager& deviceManager() noexcept { return deviceManager_; }

private:
    struct Connection {
        std::unique_ptr<transport::ITransport> transport;
        std::unique_ptr<transport::Bus> bus;
        std::unique_ptr<protocol::IModbusCodec> codec;
    };

    std::shared_ptr<Connection> activeConnection(std::string& error) const;
    void replaceConnection(std::unique_ptr<transport::ITransport> transport, TransportConfig config);
    void dropConnection(const std::shared_ptr<Connection>& failed, const std::string& reason);
    void log(const std::string& message) const;
    void notifyError(const std::string& error) const;

    mutable std::mutex connectionMutex_;
    std::shared_ptr<Connection> connection_;
    TransportConfig transportConfig_;

    DeviceManager deviceManager_;

    std::mutex scanMutex_;
    std::atomic<bool> scanning_{false};
    std::mutex cancelMutex_;
    CancellationToken* activeCancel_ = nullptr;

    LogCallback onLog_;
    LogCallback onTrace_;
    transport::ErrorCallback onError_;
};

} // namespace application
