#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/serial_port.hpp>

#include "ITransport.h"

namespace transport {

using boost::asio::ip::tcp;

struct SerialSettings {
    std::string portName;
    std::uint32_t baudRate = 9600;
    char parity = 'N';
    std::uint8_t stopBits = 1;
    std::uint8_t byteSize = 8;
};

// Blocking transport over a TCP socket or a serial port. Every operation is
// bounded: reads and connects run the private io_context for at most the
// requested duration and cancel whatever is still pending.
class AsioTransport final : public ITransport {
public:
    static std::unique_ptr<AsioTransport> connectTcp(const std::string& host,
                                                     std::uint16_t port,
                                                     bool rtuFraming,
                                                     std::chrono::milliseconds connectTimeout);
    static std::unique_ptr<AsioTransport> openSerial(const SerialSettings& settings);

    ~AsioTransport() override;

    AsioTransport(const AsioTransport&) = delete;
    AsioTransport& operator=(const AsioTransport&) = delete;

    ConnectionType connectionType() const noexcept override;
    std::string describe() const override;

    void send(const std::vector<std::uint8_t>& data) override;
    std::optional<std::vector<std::uint8_t>> receive(std::chrono::milliseconds timeout) override;
    void flushInput() override;

    std::uint16_t nextTransactionId() override;

    void close();

private:
    struct TcpTag {};
    struct SerialTag {};

    AsioTransport(TcpTag, ConnectionType type, std::string description);
    AsioTransport(SerialTag, std::string description);

    bool runFor(std::chrono::milliseconds timeout);
    void cancelPending();

    ConnectionType type_;
    std::string description_;
    boost::asio::io_context ioContext_;
    std::variant<tcp::socket, boost::asio::serial_port> stream_;
    std::array<std::uint8_t, 512> readBuffer_{};
    std::mutex ioMutex_;
    TransactionCounter transactionIds_;
    bool closed_ = false;
};

} // namespace transport
