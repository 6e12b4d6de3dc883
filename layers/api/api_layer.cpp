#include "api_layer.h"

#include <boost/beast/version.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdio>

#include "layers/protocol/protocol_layer.h"

namespace api {

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = boost::asio::ip::tcp;

namespace {

bool parseUint16Flexible(const json::value& value, std::uint16_t& out) {
    if (value.is_int64()) {
        const auto v = value.as_int64();
        if (v < 0 || v > 0xFFFF) {
            return false;
        }
        out = static_cast<std::uint16_t>(v);
        return true;
    }

    if (!value.is_string()) {
        return false;
    }

    std::string text = std::string(value.as_string().c_str());
    int base = 10;
    if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0) {
        text = text.substr(2);
        base = 16;
    }

    unsigned int parsed = 0;
    const auto* begin = text.data();
    const auto* end = begin + text.size();
    const auto res = std::from_chars(begin, end, parsed, base);
    if (res.ec != std::errc() || res.ptr != end || parsed > 0xFFFF) {
        return false;
    }

    out = static_cast<std::uint16_t>(parsed);
    return true;
}

bool parseUint8Strict(const json::object& obj, const char* key, std::uint8_t& out) {
    if (!obj.contains(key) || !obj.at(key).is_int64()) {
        return false;
    }
    const auto v = obj.at(key).as_int64();
    if (v < 0 || v > 255) {
        return false;
    }
    out = static_cast<std::uint8_t>(v);
    return true;
}

bool parseUnsigned(const json::object& obj, const char* key, unsigned maxValue, unsigned& out) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.at(key).is_int64()) {
        return false;
    }
    const auto v = obj.at(key).as_int64();
    if (v < 0 || v > static_cast<std::int64_t>(maxValue)) {
        return false;
    }
    out = static_cast<unsigned>(v);
    return true;
}

bool parseSeconds(const json::object& obj, const char* key, double& out) {
    if (!obj.contains(key)) {
        return true;
    }
    const auto& value = obj.at(key);
    if (value.is_double()) {
        out = value.as_double();
        return true;
    }
    if (value.is_int64()) {
        out = static_cast<double>(value.as_int64());
        return true;
    }
    return false;
}

std::string toLowerAscii(const std::string& src) {
    std::string out = src;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool parseRegisterType(const json::object& obj, protocol::RegisterType& out) {
    if (!obj.contains("register_type")) {
        return true;
    }
    if (!obj.at("register_type").is_string()) {
        return false;
    }
    const auto name = toLowerAscii(obj.at("register_type").as_string().c_str());
    if (name == "holding") {
        out = protocol::RegisterType::Holding;
        return true;
    }
    if (name == "input") {
        out = protocol::RegisterType::Input;
        return true;
    }
    return false;
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

std::string hexWord(std::uint16_t value) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "0x%04X", value);
    return buffer;
}

json::value numberToJson(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    return value;
}

json::value valueToJson(const protocol::Value& value) {
    if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        return *integer;
    }
    if (const auto* real = std::get_if<double>(&value)) {
        return numberToJson(*real);
    }
    return json::value(std::get<std::string>(value));
}

json::array registersToJson(const std::vector<std::uint16_t>& registers) {
    json::array out;
    for (const auto reg : registers) {
        out.push_back(reg);
    }
    return out;
}

} // namespace

json::object outcomeToJson(std::uint8_t unitId, const application::Outcome& outcome) {
    json::object out;
    out["unit_id"] = unitId;
    out["status"] = application::outcomeStatus(outcome);
    out["found"] = application::isDeviceFound(outcome);
    out["detail"] = application::describeOutcome(outcome);

    if (const auto* success = std::get_if<application::Success>(&outcome)) {
        const auto registers = protocol::toRegisters(success->rawBytes);
        out["registers"] = registersToJson(registers);
        if (!registers.empty()) {
            out["value"] = registers.front();
            out["hex"] = hexWord(registers.front());
        }
    } else if (const auto* device = std::get_if<application::DeviceError>(&outcome)) {
        out["exception_code"] = device->exceptionCode;
    } else if (const auto* gateway = std::get_if<application::GatewayError>(&outcome)) {
        out["exception_code"] = gateway->code;
    }
    return out;
}

json::object scanResultToJson(const application::ScanResult& result) {
    json::array units;
    std::size_t found = 0;
    for (const auto& [unitId, outcome] : result.outcomes) {
        if (application::isDeviceFound(outcome)) {
            ++found;
        }
        units.push_back(outcomeToJson(unitId, outcome));
    }

    json::object out;
    out["complete"] = result.complete;
    out["scanned"] = result.outcomes.size();
    out["found"] = found;
    out["results"] = units;
    return out;
}

json::object decodeReportToJson(const protocol::DecodeReport& report) {
    json::object values;
    for (const auto& decoded : report.values) {
        values[decoded.formatName] = valueToJson(decoded.value);
    }
    json::object errors;
    for (const auto& error : report.errors) {
        errors[error.formatName] = error.message;
    }

    json::object out;
    out["values"] = values;
    out["errors"] = errors;
    return out;
}

json::object readResultToJson(const application::ReadSettings& settings, const application::ReadResult& result) {
    json::object out = outcomeToJson(settings.unitId, result.outcome);
    out["register_type"] = settings.registerType == protocol::RegisterType::Input ? "input" : "holding";
    out["address"] = settings.address;
    out["count"] = settings.count;
    out["attempts"] = result.attempts;
    if (application::isSuccess(result.outcome)) {
        out["registers"] = registersToJson(result.registers);
        out["decoded"] = decodeReportToJson(result.decoded);
    }
    return out;
}

json::object deviceToJson(const application::Device& device) {
    json::object out;
    out["unit_id"] = device.unitId;
    out["found"] = device.found;
    out["success_count"] = device.successCount;
    out["fail_count"] = device.failCount;
    out["last_status"] = device.lastStatus;
    out["last_detail"] = device.lastDetail;
    return out;
}

ApiController::ApiController(application::ApplicationCore& appCore)
    : appCore_(appCore) {}

json::value ApiController::processRequest(const json::value& request) {
    if (request.is_array()) {
        return processBatch(request.as_array());
    }

    if (!request.is_object()) {
        return errorResponse(nullptr, -32600, "Invalid JSON-RPC payload");
    }

    return processSingle(request.as_object());
}

json::array ApiController::processBatch(const json::array& requests) {
    json::array responses;
    for (const auto& item : requests) {
        if (!item.is_object()) {
            responses.emplace_back(errorResponse(nullptr, -32600, "Batch item must be object"));
            continue;
        }
        responses.emplace_back(processSingle(item.as_object()));
    }
    return responses;
}

json::value ApiController::processSingle(const json::object& req) {
    const json::value id = req.contains("id") ? req.at("id") : json::value(nullptr);

    if (!req.contains("method") || !req.at("method").is_string()) {
        return errorResponse(id, -32600, "Missing method");
    }

    const std::string method = req.at("method").as_string().c_str();
    const json::object params = req.contains("params") && req.at("params").is_object()
                                    ? req.at("params").as_object()
                                    : json::object{};

    if (method == "ping") {
        json::object result;
        result["status"] = "ok";
        result["service"] = "modbus-scanner";
        result["scan_in_progress"] = appCore_.scanInProgress();
        return okResponse(id, result);
    }

    if (method == "transport.serial_ports") {
        json::array ports;
        for (const auto& p : appCore_.listSerialPorts()) {
            ports.emplace_back(p);
        }
        return okResponse(id, json::object{{"ports", ports}});
    }

    if (method == "transport.status") {
        const auto status = appCore_.transportStatus();
        json::object result;
        result["active"] = status.active;
        result["type"] = connectionTypeName(status.type);
        result["simulated"] = status.simulated;
        result["description"] = status.description;
        result["host"] = status.host;
        result["port"] = status.port;
        result["serial_port"] = status.serial.portName;
        result["baud_rate"] = status.serial.baudRate;
        result["stop_bits"] = status.serial.stopBits;
        return okResponse(id, result);
    }

    if (method == "transport.close") {
        json::object closed;
        const auto closedOk = appCore_.closeActiveTransport(closed);
        json::object result;
        result["closed"] = closedOk;
        result["details"] = closed;
        return okResponse(id, result);
    }

    if (method == "transport.open") {
        return handleTransportOpen(id, params);
    }

    if (method == "modbus.scan") {
        return handleScan(id, params);
    }

    if (method == "modbus.scan_cancel") {
        return okResponse(id, json::object{{"cancelled", appCore_.cancelScan()}});
    }

    if (method == "modbus.read") {
        return handleRead(id, params);
    }

    if (method == "modbus.stats") {
        return handleStats(id, params);
    }

    return errorResponse(id, -32601, "Method not found");
}

json::value ApiController::handleTransportOpen(const json::value& id, const json::object& params) {
    if (!params.contains("type") || !params.at("type").is_string()) {
        return errorResponse(id, -32602, "type is required");
    }

    const std::string type = params.at("type").as_string().c_str();
    std::string error;
    bool ok = false;

    if (type == "tcp" || type == "rtu_over_tcp") {
        if (!params.contains("host") || !params.at("host").is_string()) {
            return errorResponse(id, -32602, "host is required for " + type);
        }
        std::uint16_t port = 502;
        if (params.contains("port") && !parseUint16Flexible(params.at("port"), port)) {
            return errorResponse(id, -32602, "Invalid port");
        }
        ok = appCore_.openTcpTransport(params.at("host").as_string().c_str(), port, type == "rtu_over_tcp", error);
    } else if (type == "rtu") {
        if (!params.contains("serial_port") || !params.at("serial_port").is_string()) {
            return errorResponse(id, -32602, "serial_port is required for rtu");
        }
        transport::SerialSettings settings;
        settings.portName = params.at("serial_port").as_string().c_str();
        unsigned baudRate = settings.baudRate;
        unsigned stopBits = settings.stopBits;
        unsigned byteSize = settings.byteSize;
        if (!parseUnsigned(params, "baud_rate", 4000000, baudRate) || !parseUnsigned(params, "stop_bits", 2, stopBits) ||
            !parseUnsigned(params, "byte_size", 8, byteSize)) {
            return errorResponse(id, -32602, "Invalid baud_rate/stop_bits/byte_size");
        }
        if (params.contains("parity")) {
            const auto& parity = params.at("parity");
            if (!parity.is_string() || parity.as_string().size() != 1) {
                return errorResponse(id, -32602, "parity must be one of N, E, O");
            }
            settings.parity = static_cast<char>(std::toupper(static_cast<unsigned char>(parity.as_string()[0])));
        }
        settings.baudRate = baudRate;
        settings.stopBits = static_cast<std::uint8_t>(stopBits);
        settings.byteSize = static_cast<std::uint8_t>(byteSize);
        ok = appCore_.openRtuTransport(settings, error);
    } else if (type == "simulated") {
        auto framing = transport::ConnectionType::Tcp;
        if (params.contains("framing")) {
            const auto& value = params.at("framing");
            const std::string name = value.is_string() ? std::string(value.as_string().c_str()) : std::string();
            if (name == "rtu") {
                framing = transport::ConnectionType::Rtu;
            } else if (name == "rtu_over_tcp") {
                framing = transport::ConnectionType::RtuOverTcp;
            } else if (name != "tcp") {
                return errorResponse(id, -32602, "framing must be one of tcp, rtu, rtu_over_tcp");
            }
        }
        ok = appCore_.openSimulatedTransport(framing, error);
    } else {
        return errorResponse(id, -32602, "Unknown transport type");
    }

    if (!ok) {
        return errorResponse(id, -32001, error.empty() ? "Failed to open transport" : error);
    }

    json::object result;
    result["opened"] = true;
    result["type"] = type;
    result["description"] = appCore_.transportStatus().description;
    return okResponse(id, result);
}

json::value ApiController::handleScan(const json::value& id, const json::object& params) {
    application::ScanSettings settings;
    unsigned startUnit = settings.startUnit;
    unsigned endUnit = settings.endUnit;
    if (!parseUnsigned(params, "start_unit", 255, startUnit) || !parseUnsigned(params, "end_unit", 255, endUnit)) {
        return errorResponse(id, -32602, "Invalid start_unit/end_unit");
    }
    settings.startUnit = static_cast<std::uint8_t>(startUnit);
    settings.endUnit = static_cast<std::uint8_t>(endUnit);

    if (!parseSeconds(params, "timeout_s", settings.timeoutSeconds) ||
        !parseUnsigned(params, "retries", 100, settings.retries) ||
        !parseUnsigned(params, "concurrency", protocol::kMaxUnitId, settings.concurrency) ||
        !parseRegisterType(params, settings.registerType)) {
        return errorResponse(id, -32602, "Invalid timeout_s/retries/concurrency/register_type");
    }
    if (params.contains("address") && !parseUint16Flexible(params.at("address"), settings.address)) {
        return errorResponse(id, -32602, "Invalid address");
    }

    application::ScanResult result;
    std::string error;
    if (!appCore_.scanDevices(settings, result, error)) {
        return errorResponse(id, -32002, error);
    }
    return okResponse(id, scanResultToJson(result));
}

json::value ApiController::handleRead(const json::value& id, const json::object& params) {
    application::ReadSettings settings;
    if (!parseUint8Strict(params, "unit_id", settings.unitId)) {
        return errorResponse(id, -32602, "unit_id is required");
    }
    if (!params.contains("address") || !parseUint16Flexible(params.at("address"), settings.address)) {
        return errorResponse(id, -32602, "address is required");
    }

    unsigned count = settings.count;
    if (!parseUnsigned(params, "count", 0xFFFF, count) || !parseSeconds(params, "timeout_s", settings.timeoutSeconds) ||
        !parseUnsigned(params, "retries", 100, settings.retries) ||
        !parseRegisterType(params, settings.registerType)) {
        return errorResponse(id, -32602, "Invalid count/timeout_s/retries/register_type");
    }
    settings.count = static_cast<std::uint16_t>(count);

    if (params.contains("formats")) {
        if (!params.at("formats").is_array()) {
            return errorResponse(id, -32602, "formats must be an array of format names");
        }
        for (const auto& item : params.at("formats").as_array()) {
            const auto format = item.is_string() ? protocol::parseValueFormat(item.as_string().c_str()) : std::nullopt;
            if (!format) {
                return errorResponse(id, -32602, "Unknown format: " + json::serialize(item));
            }
            settings.formats.push_back(*format);
        }
    }

    application::ReadResult result;
    std::string error;
    if (!appCore_.readRegister(settings, result, error)) {
        return errorResponse(id, -32002, error);
    }
    return okResponse(id, readResultToJson(settings, result));
}

json::value ApiController::handleStats(const json::value& id, const json::object& params) {
    auto& devices = appCore_.deviceManager();
    json::array items;

    if (params.contains("unit_id")) {
        std::uint8_t unitId = 0;
        if (!parseUint8Strict(params, "unit_id", unitId)) {
            return errorResponse(id, -32602, "Invalid unit_id");
        }
        if (const auto device = devices.findByUnit(unitId)) {
            items.push_back(deviceToJson(*device));
        }
    } else {
        const bool foundOnly = params.contains("found_only") && params.at("found_only").is_bool() &&
                               params.at("found_only").as_bool();
        for (const auto& device : foundOnly ? devices.foundDevices() : devices.allDevices()) {
            items.push_back(deviceToJson(device));
        }
    }

    if (params.contains("reset") && params.at("reset").is_bool() && params.at("reset").as_bool()) {
        devices.clear();
    }
    return okResponse(id, json::object{{"devices", items}});
}

json::value ApiController::errorResponse(const json::value& id, int code, const std::string& message) const {
    json::object r;
    r["jsonrpc"] = "2.0";
    r["id"] = id;
    json::object e;
    e["code"] = code;
    e["message"] = message;
    r["error"] = e;
    return r;
}

json::value ApiController::okResponse(const json::value& id, const json::value& result) const {
    json::object r;
    r["jsonrpc"] = "2.0";
    r["id"] = id;
    r["result"] = result;
    return r;
}

HttpJsonServer::HttpJsonServer(application::ApplicationCore& appCore, std::string bindAddress, std::uint16_t port)
    : appCore_(appCore), bindAddress_(std::move(bindAddress)), port_(port) {}

HttpJsonServer::~HttpJsonServer() {
    stop();
}

void HttpJsonServer::start() {
    if (running_) {
        return;
    }

    running_ = true;
    acceptor_ = std::make_unique<tcp::acceptor>(ioContext_, tcp::endpoint{boost::asio::ip::make_address(bindAddress_), port_});

    serverThread_ = std::thread([this]() { acceptLoop(); });
}

void HttpJsonServer::stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    appCore_.cancelScan();
    boost::system::error_code ec;
    if (acceptor_) {
        acceptor_->cancel(ec);
        acceptor_->close(ec);
    }
    ioContext_.stop();

    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    std::vector<Session> sessions;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessions.swap(sessions_);
    }
    for (auto& session : sessions) {
        if (session.thread.joinable()) {
            session.thread.join();
        }
    }
}

void HttpJsonServer::reapFinishedSessions() {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto finished = std::partition(sessions_.begin(), sessions_.end(),
                                   [](const Session& session) { return !session.done->load(); });
    for (auto it = finished; it != sessions_.end(); ++it) {
        it->thread.join();
    }
    sessions_.erase(finished, sessions_.end());
}

void HttpJsonServer::acceptLoop() {
    while (running_) {
        boost::system::error_code ec;
        tcp::socket socket(ioContext_);
        acceptor_->accept(socket, ec);
        if (ec) {
            continue;
        }
        reapFinishedSessions();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread worker([this, done, s = std::move(socket)]() mutable {
            handleSession(std::move(s));
            done->store(true);
        });
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessions_.push_back(Session{std::move(worker), std::move(done)});
    }
}

void HttpJsonServer::handleSession(tcp::socket socket) {
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    boost::system::error_code ec;

    http::read(socket, buffer, req, ec);
    if (ec) {
        return;
    }

    http::response<http::string_body> res;
    res.version(req.version());
    res.keep_alive(false);
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");

    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "POST, OPTIONS, GET");
    res.set(http::field::access_control_allow_headers, "Content-Type, Accept");
    res.set(http::field::access_control_max_age, "86400");

    if (req.method() == http::verb::options) {
        res.result(http::status::no_content);
        res.body().clear();
        res.prepare_payload();
        http::write(socket, res, ec);
        return;
    }

    if (req.method() != http::verb::post) {
        res.result(http::status::method_not_allowed);
        res.body() = R"({"jsonrpc":"2.0","id":null,"error":{"code":-32600,"message":"Only POST method is supported"}})";
        res.prepare_payload();
        http::write(socket, res, ec);
        return;
    }

    json::value payload;
    try {
        payload = json::parse(req.body());
    } catch (const std::exception&) {
        res.result(http::status::bad_request);
        res.body() = R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error: invalid JSON"}})";
        res.prepare_payload();
        http::write(socket, res, ec);
        return;
    }

    ApiController controller(appCore_);
    const auto response = controller.processRequest(payload);

    res.result(http::status::ok);
    res.body() = json::serialize(response);
    res.prepare_payload();

    http::write(socket, res, ec);

    socket.shutdown(tcp::socket::shutdown_both, ec);
}

} // namespace api
