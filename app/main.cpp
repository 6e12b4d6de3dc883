#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "layers/api/api_layer.h"
#include "layers/application/application_layer.h"
#include "layers/protocol/ValueDecoder.h"
#include "layers/transport/transport_layer.h"

namespace {

struct StartupOptions {
    std::string mode = "api";                 // api | scan | read
    std::string bindAddress = "0.0.0.0";
    std::uint16_t apiPort = 8080;

    std::string startupTransport = "none";    // none | tcp | rtu | rtu-over-tcp | simulated
    std::string tcpHost = "127.0.0.1";
    std::uint16_t tcpPort = 502;

    std::string rtuPort;
    std::uint32_t rtuBaud = 9600;
    char rtuParity = 'N';
    std::uint8_t rtuStopBits = 1;
    std::uint8_t rtuByteSize = 8;

    std::uint8_t startUnit = 1;
    std::uint8_t endUnit = 247;
    std::uint8_t unitId = 1;
    std::uint16_t address = 0;
    std::uint16_t count = 1;
    bool input = false;
    double timeoutSeconds = 3.0;
    unsigned retries = 0;
    unsigned concurrency = 1;
    std::vector<protocol::ValueFormat> formats;

    bool verboseModbus = false;
    bool showHelp = false;
};

void printUsage() {
    std::cout
        << "Usage: modbus_scanner [options]\n"
        << "Options:\n"
        << "  --mode <api|scan|read>         Run mode (default: api)\n"
        << "  --bind <ip>                    API bind address (default: 0.0.0.0)\n"
        << "  --api-port <port>              API TCP port (default: 8080)\n"
        << "  --transport <type>             none|tcp|rtu|rtu-over-tcp|simulated (default: none)\n"
        << "\n"
        << "  TCP parameters:\n"
        << "    --tcp-host <ip>              TCP host (default: 127.0.0.1)\n"
        << "    --tcp-port <port>            TCP port (default: 502)\n"
        << "\n"
        << "  RTU parameters:\n"
        << "    --rtu-port <path_or_name>    Serial port, e.g. /dev/ttyUSB0 or COM3\n"
        << "    --rtu-baud <rate>            Baud rate (default: 9600)\n"
        << "    --rtu-parity <N|E|O>         Parity (default: N)\n"
        << "    --rtu-stop-bits <1|2>        Stop bits (default: 1)\n"
        << "    --rtu-byte-size <5-8>        Data bits (default: 8)\n"
        << "\n"
        << "  Scan / read parameters:\n"
        << "    --start <id>                 First unit id to scan (default: 1)\n"
        << "    --end <id>                   Last unit id to scan (default: 247)\n"
        << "    --unit <id>                  Unit id to read (default: 1)\n"
        << "    --address <register>         Register address, decimal or 0x-hex (default: 0)\n"
        << "    --count <n>                  Registers to read, 1-125 (default: 1)\n"
        << "    --input                      Use input registers instead of holding registers\n"
        << "    --timeout <seconds>          Response timeout per attempt (default: 3)\n"
        << "    --retries <n>                Retries after a timeout (default: 0)\n"
        << "    --concurrency <n>            Units probed in parallel (default: 1)\n"
        << "    --formats <a,b,...>          Decoded formats for --mode read (default: all)\n"
        << "\n"
        << "  Other:\n"
        << "    --verbose-modbus             Print every attempt, response and discarded frame\n"
        << "    --help                       Show this help\n";
}

template <typename UInt>
bool parseUnsigned(const std::string& text, UInt& out) {
    try {
        const bool hex = text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0;
        std::size_t consumed = 0;
        unsigned long long value = std::stoull(text, &consumed, hex ? 16 : 10);
        if (text.empty() || text[0] == '-' || consumed != text.size() ||
            value > static_cast<unsigned long long>(std::numeric_limits<UInt>::max())) {
            return false;
        }
        out = static_cast<UInt>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseSeconds(const std::string& text, double& out) {
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseFormats(const std::string& text, std::vector<protocol::ValueFormat>& out, std::string& error) {
    std::istringstream stream(text);
    std::string name;
    while (std::getline(stream, name, ',')) {
        if (name.empty()) {
            continue;
        }
        const auto format = protocol::parseValueFormat(name);
        if (!format) {
            error = "Unknown format: " + name;
            return false;
        }
        out.push_back(*format);
    }
    return true;
}

std::optional<StartupOptions> parseArgs(int argc, char* argv[], std::string& error) {
    StartupOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto getValue = [&](const std::string& key) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        auto getNumber = [&](auto& target) -> bool {
            auto value = getValue(arg);
            if (!value) return false;
            if (!parseUnsigned(*value, target)) {
                error = "Invalid " + arg + " value: " + *value;
                return false;
            }
            return true;
        };

        if (arg == "--help") {
            options.showHelp = true;
            continue;
        }
        if (arg == "--verbose-modbus") {
            options.verboseModbus = true;
            continue;
        }
        if (arg == "--input") {
            options.input = true;
            continue;
        }
        if (arg == "--mode") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.mode = *value;
            continue;
        }
        if (arg == "--bind") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.bindAddress = *value;
            continue;
        }
        if (arg == "--transport") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.startupTransport = *value;
            continue;
        }
        if (arg == "--tcp-host") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.tcpHost = *value;
            continue;
        }
        if (arg == "--rtu-port") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.rtuPort = *value;
            continue;
        }
        if (arg == "--rtu-parity") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (*value != "N" && *value != "E" && *value != "O") {
                error = "--rtu-parity must be N, E or O";
                return std::nullopt;
            }
            options.rtuParity = (*value)[0];
            continue;
        }
        if (arg == "--timeout") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (!parseSeconds(*value, options.timeoutSeconds)) {
                error = "Invalid --timeout value: " + *value;
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--formats") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (!parseFormats(*value, options.formats, error)) {
                return std::nullopt;
            }
            continue;
        }

        bool numeric = true;
        bool ok = false;
        if (arg == "--api-port") {
            ok = getNumber(options.apiPort);
        } else if (arg == "--tcp-port") {
            ok = getNumber(options.tcpPort);
        } else if (arg == "--rtu-baud") {
            ok = getNumber(options.rtuBaud);
        } else if (arg == "--rtu-stop-bits") {
            ok = getNumber(options.rtuStopBits);
        } else if (arg == "--rtu-byte-size") {
            ok = getNumber(options.rtuByteSize);
        } else if (arg == "--start") {
            ok = getNumber(options.startUnit);
        } else if (arg == "--end") {
            ok = getNumber(options.endUnit);
        } else if (arg == "--unit") {
            ok = getNumber(options.unitId);
        } else if (arg == "--address") {
            ok = getNumber(options.address);
        } else if (arg == "--count") {
            ok = getNumber(options.count);
        } else if (arg == "--retries") {
            ok = getNumber(options.retries);
        } else if (arg == "--concurrency") {
            ok = getNumber(options.concurrency);
        } else {
            numeric = false;
        }
        if (numeric) {
            if (!ok) return std::nullopt;
            continue;
        }

        error = "Unknown argument: " + arg;
        return std::nullopt;
    }

    if (options.mode != "api" && options.mode != "scan" && options.mode != "read") {
        error = "Unsupported --mode. Use api, scan or read";
        return std::nullopt;
    }

    const auto& t = options.startupTransport;
    if (t != "none" && t != "tcp" && t != "rtu" && t != "rtu-over-tcp" && t != "simulated") {
        error = "Unsupported --transport. Use none, tcp, rtu, rtu-over-tcp or simulated";
        return std::nullopt;
    }

    if (options.mode != "api" && t == "none") {
        error = "--mode " + options.mode + " requires a --transport";
        return std::nullopt;
    }

    if (t == "rtu" && options.rtuPort.empty()) {
        error = "--rtu-port is required when --transport rtu";
        return std::nullopt;
    }

    if (options.rtuStopBits != 1 && options.rtuStopBits != 2) {
        error = "--rtu-stop-bits must be 1 or 2";
        return std::nullopt;
    }

    if (options.rtuByteSize < 5 || options.rtuByteSize > 8) {
        error = "--rtu-byte-size must be between 5 and 8";
        return std::nullopt;
    }

    return options;
}

bool openStartupTransport(application::ApplicationCore& appCore, const StartupOptions& options) {
    const auto& type = options.startupTransport;
    if (type == "none") {
        return true;
    }

    std::string error;
    bool opened = false;

    if (type == "tcp" || type == "rtu-over-tcp") {
        opened = appCore.openTcpTransport(options.tcpHost, options.tcpPort, type == "rtu-over-tcp", error);
    } else if (type == "rtu") {
        transport::SerialSettings settings;
        settings.portName = options.rtuPort;
        settings.baudRate = options.rtuBaud;
        settings.parity = options.rtuParity;
        settings.stopBits = options.rtuStopBits;
        settings.byteSize = options.rtuByteSize;
        opened = appCore.openRtuTransport(settings, error);
    } else {
        opened = appCore.openSimulatedTransport(transport::ConnectionType::Tcp, error);
    }

    if (!opened) {
        std::cerr << "Failed to open startup transport: " << error << std::endl;
    }
    return opened;
}

protocol::RegisterType registerType(const StartupOptions& options) {
    return options.input ? protocol::RegisterType::Input : protocol::RegisterType::Holding;
}

int runScan(application::ApplicationCore& appCore, const StartupOptions& options) {
    application::ScanSettings settings;
    settings.startUnit = options.startUnit;
    settings.endUnit = options.endUnit;
    settings.timeoutSeconds = options.timeoutSeconds;
    settings.retries = options.retries;
    settings.address = options.address;
    settings.registerType = registerType(options);
    settings.concurrency = options.concurrency;

    // Armed before the scan starts, so an early Ctrl-C is not lost.
    application::CancellationToken interrupted;
    boost::asio::io_context signals;
    boost::asio::signal_set signalSet(signals, SIGINT, SIGTERM);
    signalSet.async_wait([&interrupted](const boost::system::error_code& ec, int) {
        if (!ec) {
            std::cout << "[scan] Interrupted, cancelling" << std::endl;
            interrupted.cancel();
        }
    });
    std::thread signalThread([&signals]() { signals.run(); });

    application::ScanResult result;
    std::string error;
    const auto printOutcome = [](std::uint8_t unitId, const application::Outcome& outcome) {
        std::cout << "[scan] Unit " << static_cast<int>(unitId) << ": " << application::describeOutcome(outcome)
                  << std::endl;
    };
    const bool ok = appCore.scanDevices(settings, result, error, printOutcome, &interrupted);

    signalSet.cancel();
    signals.stop();
    signalThread.join();

    if (!ok) {
        std::cerr << "[scan] " << error << std::endl;
        return 1;
    }

    std::size_t found = 0;
    for (const auto& entry : result.outcomes) {
        if (application::isDeviceFound(entry.second)) {
            ++found;
        }
    }
    std::cout << "[scan] " << (result.complete ? "Complete" : "Incomplete") << ": " << found << " of "
              << result.outcomes.size() << " units responded" << std::endl;
    std::cout << boost::json::serialize(api::scanResultToJson(result)) << std::endl;
    return result.complete ? 0 : 130;
}

int runRead(application::ApplicationCore& appCore, const StartupOptions& options) {
    application::ReadSettings settings;
    settings.unitId = options.unitId;
    settings.registerType = registerType(options);
    settings.address = options.address;
    settings.count = options.count;
    settings.formats = options.formats;
    settings.timeoutSeconds = options.timeoutSeconds;
    settings.retries = options.retries;

    application::ReadResult result;
    std::string error;
    if (!appCore.readRegister(settings, result, error)) {
        std::cerr << "[read] " << error << std::endl;
        return 1;
    }

    std::cout << "[read] Unit " << static_cast<int>(settings.unitId) << ": "
              << application::describeOutcome(result.outcome) << " after " << result.attempts << " attempt(s)"
              << std::endl;
    std::cout << boost::json::serialize(api::readResultToJson(settings, result)) << std::endl;
    return application::isSuccess(result.outcome) ? 0 : 1;
}

int runApi(application::ApplicationCore& appCore, const StartupOptions& options) {
    api::HttpJsonServer server(appCore, options.bindAddress, options.apiPort);
    try {
        server.start();
    } catch (const boost::system::system_error& e) {
        std::cerr << "Failed to start HTTP JSON API: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "HTTP JSON API started on " << options.bindAddress << ':' << options.apiPort << std::endl;

    boost::asio::io_context signals;
    boost::asio::signal_set signalSet(signals, SIGINT, SIGTERM);
    signalSet.async_wait([](const boost::system::error_code&, int) {});
    signals.run();

    std::cout << "Shutting down" << std::endl;
    server.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string parseError;
    const auto parsed = parseArgs(argc, argv, parseError);
    if (!parsed) {
        std::cerr << parseError << "\n\n";
        printUsage();
        return 2;
    }

    const auto options = *parsed;
    if (options.showHelp) {
        printUsage();
        return 0;
    }

    application::ApplicationCore appCore;
    appCore.setLogCallback([](const std::string& message) {
        std::cout << "[transport] " << message << std::endl;
    });
    appCore.setErrorCallback([](const std::string& error) {
        std::cerr << "[transport] " << error << std::endl;
    });
    if (options.verboseModbus) {
        appCore.setTraceCallback([](const std::string& message) {
            std::cout << "[modbus] " << message << std::endl;
        });
    }

    if (!openStartupTransport(appCore, options)) {
        return 1;
    }

    std::cout << "Mode: " << options.mode << std::endl;
    std::cout << "Startup transport: " << options.startupTransport << std::endl;

    if (options.mode == "scan") {
        return runScan(appCore, options);
    }
    if (options.mode == "read") {
        return runRead(appCore, options);
    }
    return runApi(appCore, options);
}
