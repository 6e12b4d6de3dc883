#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "layers/application/application_layer.h"

namespace api {

boost::json::object outcomeToJson(std::uint8_t unitId, const application::Outcome& outcome);
boost::json::object scanResultToJson(const application::ScanResult& result);
boost::json::object decodeReportToJson(const protocol::DecodeReport& report);
boost::json::object readResultToJson(const application::ReadSettings& settings, const application::ReadResult& result);
boost::json::object deviceToJson(const application::Device& device);

// JSON-RPC 2.0 dispatcher over ApplicationCore.
class ApiController {
public:
    explicit ApiController(application::ApplicationCore& appCore);

    boost::json::value processRequest(const boost::json::value& request);
    boost::json::array processBatch(const boost::json::array& requests);

private:
    boost::json::value processSingle(const boost::json::object& req);
    boost::json::value handleTransportOpen(const boost::json::value& id, const boost::json::object& params);
    boost::json::value handleScan(const boost::json::value& id, const boost::json::object& params);
    boost::json::value handleRead(const boost::json::value& id, const boost::json::object& params);
    boost::json::value handleStats(const boost::json::value& id, const boost::json::object& params);

    boost::json::value errorResponse(const boost::json::value& id, int code, const std::string& message) const;
    boost::json::value okResponse(const boost::json::value& id, const boost::json::value& result) const;

    application::ApplicationCore& appCore_;
};

// One thread per HTTP connection so that `modbus.scan_cancel` can reach a running scan.
class HttpJsonServer {
public:
    HttpJsonServer(application::ApplicationCore& appCore, std::string bindAddress, std::uint16_t port);
    ~HttpJsonServer();

    void start();
    void stop();

private:
    void acceptLoop();
    void handleSession(boost::asio::ip::tcp::socket socket);

    application::ApplicationCore& appCore_;
    std::string bindAddress_;
    std::uint16_t port_;

    boost::asio::io_context ioContext_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::atomic<bool> running_{false};
    std::thread serverThread_;

    struct Session {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    void reapFinishedSessions();

    std::mutex sessionsMutex_;
    std::vector<Session> sessions_;
};

} // namespace api
