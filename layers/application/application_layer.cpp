#include "application_layer.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#endif

#include "ScanOrchestrator.h"
#include "TransactionRunner.h"
#include "infrastructure/transport/InMemoryModbusTransport.h"
#include "layers/protocol/protocol_layer.h"

namespace application {

namespace json = boost::json;

namespace {

bool toTimeout(double seconds, std::chrono::milliseconds& out, std::string& error) {
    if (!(seconds > 0.0) || seconds > 600.0) {
        error = "timeout must be in (0, 600] seconds";
        return false;
    }
    out = std::chrono::milliseconds(std::max<long long>(1, std::llround(seconds * 1000.0)));
    return true;
}

bool validUnitId(unsigned unitId) {
    return unitId >= protocol::kMinUnitId && unitId <= protocol::kMaxUnitId;
}

const char* connectionTypeName(transport::ConnectionType type) {
    switch (type) {
        case transport::ConnectionType::Tcp:
            return "tcp";
        case transport::ConnectionType::Rtu:
            return "rtu";
        case transport::ConnectionType::RtuOverTcp:
            return "rtu_over_tcp";
    }
    return "unknown";
}

// Publishes the running scan's token to cancelScan() and withdraws it on every exit.
class ActiveScan {
public:
    ActiveScan(std::atomic<bool>& scanning, std::mutex& cancelMutex, CancellationToken*& slot, CancellationToken& token)
        : scanning_(scanning), cancelMutex_(cancelMutex), slot_(slot) {
        std::lock_guard<std::mutex> lock(cancelMutex_);
        slot_ = &token;
        scanning_ = true;
    }

    ~ActiveScan() {
        std::lock_guard<std::mutex> lock(cancelMutex_);
        slot_ = nullptr;
        scanning_ = false;
    }

    ActiveScan(const ActiveScan&) = delete;
    ActiveScan& operator=(const ActiveScan&) = delete;

private:
    std::atomic<bool>& scanning_;
    std::mutex& cancelMutex_;
    CancellationToken*& slot_;
};

} // namespace

void ApplicationCore::setLogCallback(LogCallback cb) { onLog_ = std::move(cb); }

void ApplicationCore::setTraceCallback(LogCallback cb) { onTrace_ = std::move(cb); }

void ApplicationCore::setErrorCallback(transport::ErrorCallback cb) { onError_ = std::move(cb); }

bool ApplicationCore::openTcpTransport(const std::string& host, std::uint16_t port, bool rtuOverTcp,
                                       std::string& error, std::chrono::milliseconds connectTimeout) {
    std::unique_ptr<transport::AsioTransport> transport;
    try {
        transport = transport::AsioTransport::connectTcp(host, port, rtuOverTcp, connectTimeout);
    } catch (const transport::TransportError& e) {
        error = e.what();
        notifyError(error);
        return false;
    }

    TransportConfig config;
    config.type = rtuOverTcp ? transport::ConnectionType::RtuOverTcp : transport::ConnectionType::Tcp;
    config.host = host;
    config.port = port;
    replaceConnection(std::move(transport), std::move(config));
    return true;
}

bool ApplicationCore::openRtuTransport(const transport::SerialSettings& settings, std::string& error) {
    if (settings.portName.empty()) {
        error = "serial port name is required";
        return false;
    }

    std::unique_ptr<transport::AsioTransport> transport;
    try {
        transport = transport::AsioTransport::openSerial(settings);
    } catch (const transport::TransportError& e) {
        error = e.what();
        notifyError(error);
        return false;
    }

    TransportConfig config;
    config.type = transport::ConnectionType::Rtu;
    config.serial = settings;
    replaceConnection(std::move(transport), std::move(config));
    return true;
}

bool ApplicationCore::openSimulatedTransport(transport::ConnectionType framing, std::string&) {
    TransportConfig config;
    config.type = framing;
    config.simulated = true;
    replaceConnection(transport::InMemoryModbusTransport::withReferenceDevices(framing), std::move(config));
    return true;
}

void ApplicationCore::attachTransport(std::unique_ptr<transport::ITransport> transport, TransportConfig config) {
    config.type = transport->connectionType();
    replaceConnection(std::move(transport), std::move(config));
}

void ApplicationCore::replaceConnection(std::unique_ptr<transport::ITransport> transport, TransportConfig config) {
    auto connection = std::make_shared<Connection>();
    connection->codec = protocol::makeCodec(transport->connectionType());
    connection->bus = std::make_unique<transport::Bus>(*transport);
    connection->transport = std::move(transport);

    config.active = true;
    config.description = connection->transport->describe();

    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        connection_ = std::move(connection);
        transportConfig_ = std::move(config);
    }
    log("Transport opened: " + transportStatus().description);
}

bool ApplicationCore::closeActiveTransport(json::object& closedInfo) {
    std::shared_ptr<Connection> closed;
    TransportConfig snapshot;
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        if (!transportConfig_.active) {
            return false;
        }
        closed = std::move(connection_);
        snapshot = transportConfig_;
        transportConfig_.active = false;
    }

    closedInfo["type"] = connectionTypeName(snapshot.type);
    closedInfo["description"] = snapshot.description;
    if (snapshot.type == transport::ConnectionType::Rtu && !snapshot.simulated) {
        closedInfo["serial_port"] = snapshot.serial.portName;
        closedInfo["baud_rate"] = snapshot.serial.baudRate;
        closedInfo["stop_bits"] = snapshot.serial.stopBits;
    } else if (!snapshot.simulated) {
        closedInfo["host"] = snapshot.host;
        closedInfo["port"] = snapshot.port;
    }
    log("Transport closed: " + snapshot.description);
    return true;
}

TransportConfig ApplicationCore::transportStatus() const {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    return transportConfig_;
}

std::vector<std::string> ApplicationCore::listSerialPorts() const {
    std::vector<std::string> ports;
#ifdef _WIN32
    for (int i = 1; i <= 256; ++i) {
        const std::string name = "COM" + std::to_string(i);
        char targetPath[16] = {0};
        if (QueryDosDeviceA(name.c_str(), targetPath, static_cast<DWORD>(sizeof(targetPath))) != 0) {
            ports.push_back(name);
        }
    }
#else
    const std::vector<std::string> prefixes = {"ttyS", "ttyUSB", "ttyACM", "ttyAMA", "rfcomm"};
    const std::filesystem::path devPath{"/dev"};
    std::error_code ec;
    if (std::filesystem::exists(devPath, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(devPath, ec)) {
            const auto fileName = entry.path().filename().string();
            for (const auto& prefix : prefixes) {
                if (fileName.rfind(prefix, 0) == 0) {
                    ports.push_back(entry.path().string());
                    break;
                }
            }
        }
    }
#endif
    return ports;
}

bool ApplicationCore::scanDevices(const ScanSettings& settings, ScanResult& result, std::string& error,
                                  const OutcomeCallback& onOutcome, const CancellationToken* interrupt) {
    if (!validUnitId(settings.startUnit) || !validUnitId(settings.endUnit) || settings.startUnit > settings.endUnit) {
        error = "unit id range must satisfy 1 <= start_unit <= end_unit <= 247";
        return false;
    }
    if (settings.concurrency == 0) {
        error = "concurrency must be at least 1";
        return false;
    }

    protocol::ModbusRequest probe;
    probe.registerType = settings.registerType;
    probe.startAddress = settings.address;
    probe.count = 1;
    probe.maxRetries = settings.retries;
    if (!toTimeout(settings.timeoutSeconds, probe.timeout, error)) {
        return false;
    }

    std::unique_lock<std::mutex> scanLock(scanMutex_, std::try_to_lock);
    if (!scanLock.owns_lock()) {
        error = "A scan is already running";
        return false;
    }

    auto connection = activeConnection(error);
    if (!connection) {
        return false;
    }

    CancellationToken cancel(interrupt);
    const ActiveScan active(scanning_, cancelMutex_, activeCancel_, cancel);
    log("Scanning units " + std::to_string(settings.startUnit) + "-" + std::to_string(settings.endUnit) + " on " +
        connection->transport->describe());

    ScanOrchestrator orchestrator(*connection->bus, *connection->codec);
    orchestrator.setLogCallback(onTrace_);
    try {
        result = orchestrator.scan(settings.startUnit, settings.endUnit, probe, settings.concurrency, cancel,
                                   onOutcome);
    } catch (const transport::TransportError& e) {
        error = std::string("Transport failure: ") + e.what();
        dropConnection(connection, error);
        return false;
    } catch (const std::exception& e) {
        error = std::string("Scan failed: ") + e.what();
        notifyError(error);
        return false;
    }

    deviceManager_.recordScan(result);
    return true;
}

bool ApplicationCore::cancelScan() {
    {
        std::lock_guard<std::mutex> lock(cancelMutex_);
        if (activeCancel_ == nullptr) {
            return false;
        }
        activeCancel_->cancel();
    }
    log("Scan cancellation requested");
    return true;
}

bool ApplicationCore::readRegister(const ReadSettings& settings, ReadResult& result, std::string& error) {
    if (!validUnitId(settings.unitId)) {
        error = "unit_id must be in [1, 247]";
        return false;
    }
    if (settings.count == 0 || settings.count > protocol::kMaxReadCount) {
        error = "count must be in [1, 125]";
        return false;
    }
    if (static_cast<std::uint32_t>(settings.address) + settings.count - 1 > 0xFFFF) {
        error = "address range exceeds 65535";
        return false;
    }

    protocol::ModbusRequest request;
    request.unitId = settings.unitId;
    request.registerType = settings.registerType;
    request.startAddress = settings.address;
    request.count = settings.count;
    request.maxRetries = settings.retries;
    if (!toTimeout(settings.timeoutSeconds, request.timeout, error)) {
        return false;
    }

    auto connection = activeConnection(error);
    if (!connection) {
        return false;
    }

    TransactionRunner runner(*connection->bus, *connection->codec);
    runner.setLogCallback(onTrace_);

    const CancellationToken never;
    TransactionResult transaction;
    try {
        transaction = runner.run(request, never);
    } catch (const transport::TransportError& e) {
        error = std::string("Transport failure: ") + e.what();
        dropConnection(connection, error);
        return false;
    } catch (const std::exception& e) {
        error = std::string("Read failed: ") + e.what();
        notifyError(error);
        return false;
    }

    result = ReadResult{};
    result.outcome = transaction.outcome;
    result.attempts = transaction.attempts;
    if (const auto* success = std::get_if<Success>(&transaction.outcome)) {
        result.registers = protocol::toRegisters(success->rawBytes);
        const auto& formats = settings.formats.empty() ? protocol::allValueFormats() : settings.formats;
        result.decoded = protocol::decodeValues(success->rawBytes, formats);
    }

    deviceManager_.record(settings.unitId, transaction.outcome);
    return true;
}

std::shared_ptr<ApplicationCore::Connection> ApplicationCore::activeConnection(std::string& error) const {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    if (!connection_ || !transportConfig_.active) {
        error = "No active transport";
        return nullptr;
    }
    return connection_;
}

void ApplicationCore::dropConnection(const std::shared_ptr<Connection>& failed, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        if (connection_ == failed) {
            connection_.reset();
            transportConfig_.active = false;
        }
    }
    notifyError(reason);
}

void ApplicationCore::log(const std::string& message) const {
    if (onLog_) {
        onLog_(message);
    }
}

void ApplicationCore::notifyError(const std::string& error) const {
    if (onError_) {
        onError_(error);
    }
}

} // namespace application
