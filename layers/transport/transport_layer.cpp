#include "transport_layer.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <termios.h>
#endif

namespace transport {

namespace {

template <typename Stream>
void closeStream(Stream& stream) {
    boost::system::error_code ec;
    stream.cancel(ec);
    stream.close(ec);
}

boost::asio::serial_port_base::parity::type parityFromChar(char parity) {
    switch (parity) {
        case 'E':
        case 'e':
            return boost::asio::serial_port_base::parity::even;
        case 'O':
        case 'o':
            return boost::asio::serial_port_base::parity::odd;
        default:
            return boost::asio::serial_port_base::parity::none;
    }
}

} // namespace

AsioTransport::AsioTransport(TcpTag, ConnectionType type, std::string description)
    : type_(type),
      description_(std::move(description)),
      stream_(std::in_place_type<tcp::socket>, ioContext_) {}

AsioTransport::AsioTransport(SerialTag, std::string description)
    : type_(ConnectionType::Rtu),
      description_(std::move(description)),
      stream_(std::in_place_type<boost::asio::serial_port>, ioContext_) {}

AsioTransport::~AsioTransport() {
    close();
}

std::unique_ptr<AsioTransport> AsioTransport::connectTcp(const std::string& host,
                                                         std::uint16_t port,
                                                         bool rtuFraming,
                                                         std::chrono::milliseconds connectTimeout) {
    const auto type = rtuFraming ? ConnectionType::RtuOverTcp : ConnectionType::Tcp;
    const std::string scheme = rtuFraming ? "rtu-over-tcp://" : "tcp://";
    std::unique_ptr<AsioTransport> transport(
        new AsioTransport(TcpTag{}, type, scheme + host + ":" + std::to_string(port)));

    boost::system::error_code ec;
    tcp::resolver resolver(transport->ioContext_);
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw TransportError("Cannot resolve " + host + ": " + ec.message());
    }

    auto& socket = std::get<tcp::socket>(transport->stream_);
    boost::system::error_code connectEc = boost::asio::error::would_block;
    boost::asio::async_connect(socket, endpoints,
        [&connectEc](const boost::system::error_code& result, const tcp::endpoint&) { connectEc = result; });

    if (!transport->runFor(connectTimeout) || connectEc == boost::asio::error::operation_aborted) {
        throw TransportError("Connection timed out: " + host + ":" + std::to_string(port));
    }
    if (connectEc == boost::asio::error::connection_refused) {
        throw TransportError("Connection refused: " + host + ":" + std::to_string(port));
    }
    if (connectEc) {
        throw TransportError("TCP connect error: " + connectEc.message());
    }

    socket.set_option(tcp::no_delay(true), ec);
    return transport;
}

std::unique_ptr<AsioTransport> AsioTransport::openSerial(const SerialSettings& settings) {
    std::ostringstream description;
    description << "rtu:" << settings.portName << '@' << settings.baudRate << ' '
                << static_cast<int>(settings.byteSize) << settings.parity << static_cast<int>(settings.stopBits);
    std::unique_ptr<AsioTransport> transport(new AsioTransport(SerialTag{}, description.str()));

    auto& port = std::get<boost::asio::serial_port>(transport->stream_);
    try {
        port.open(settings.portName);
        port.set_option(boost::asio::serial_port_base::baud_rate(settings.baudRate));
        port.set_option(boost::asio::serial_port_base::character_size(settings.byteSize));
        port.set_option(boost::asio::serial_port_base::parity(parityFromChar(settings.parity)));
        port.set_option(boost::asio::serial_port_base::stop_bits(
            settings.stopBits == 2 ? boost::asio::serial_port_base::stop_bits::two
                                   : boost::asio::serial_port_base::stop_bits::one));
    } catch (const boost::system::system_error& e) {
        throw TransportError(std::string("Serial open error: ") + e.what());
    }
    return transport;
}

ConnectionType AsioTransport::connectionType() const noexcept { return type_; }

std::string AsioTransport::describe() const { return description_; }

std::uint16_t AsioTransport::nextTransactionId() { return transactionIds_.next(); }

void AsioTransport::send(const std::vector<std::uint8_t>& data) {
    std::lock_guard<std::mutex> lock(ioMutex_);
    if (closed_) {
        throw TransportError("Cannot send: " + description_ + " is closed");
    }

    boost::system::error_code ec;
    std::visit([&](auto& stream) { boost::asio::write(stream, boost::asio::buffer(data), ec); }, stream_);
    if (ec) {
        closed_ = true;
        throw TransportError("Write error on " + description_ + ": " + ec.message());
    }
}

std::optional<std::vector<std::uint8_t>> AsioTransport::receive(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(ioMutex_);
    if (closed_) {
        throw TransportError("Cannot receive: " + description_ + " is closed");
    }

    boost::system::error_code readEc = boost::asio::error::would_block;
    std::size_t bytesRead = 0;
    std::visit(
        [&](auto& stream) {
            stream.async_read_some(boost::asio::buffer(readBuffer_),
                [&](const boost::system::error_code& ec, std::size_t n) {
                    readEc = ec;
                    bytesRead = n;
                });
        },
        stream_);

    runFor(timeout);

    // A read that finished while the timeout was being handled still counts.
    if (!readEc && bytesRead > 0) {
        return std::vector<std::uint8_t>(readBuffer_.begin(), readBuffer_.begin() + bytesRead);
    }
    if (!readEc || readEc == boost::asio::error::operation_aborted) {
        return std::nullopt;
    }

    closed_ = true;
    if (readEc == boost::asio::error::eof) {
        throw TransportError("Connection closed by peer: " + description_);
    }
    throw TransportError("Read error on " + description_ + ": " + readEc.message());
}

void AsioTransport::flushInput() {
    std::lock_guard<std::mutex> lock(ioMutex_);
    if (closed_) {
        throw TransportError("Cannot flush: " + description_ + " is closed");
    }

    if (auto* socket = std::get_if<tcp::socket>(&stream_)) {
        boost::system::error_code ec;
        auto available = socket->available(ec);
        while (!ec && available > 0) {
            socket->read_some(boost::asio::buffer(readBuffer_, std::min(available, readBuffer_.size())), ec);
            if (!ec) {
                available = socket->available(ec);
            }
        }
        if (ec) {
            closed_ = true;
            throw TransportError("Read error on " + description_ + ": " + ec.message());
        }
        return;
    }

    auto& port = std::get<boost::asio::serial_port>(stream_);
#ifdef _WIN32
    if (!PurgeComm(port.native_handle(), PURGE_RXCLEAR)) {
        throw TransportError("Cannot flush " + description_ + ": error " + std::to_string(GetLastError()));
    }
#else
    if (::tcflush(port.native_handle(), TCIFLUSH) != 0) {
        throw TransportError("Cannot flush " + description_ + ": " + std::strerror(errno));
    }
#endif
}

void AsioTransport::close() {
    std::lock_guard<std::mutex> lock(ioMutex_);
    closed_ = true;
    std::visit([](auto& stream) { closeStream(stream); }, stream_);
}

bool AsioTransport::runFor(std::chrono::milliseconds timeout) {
    ioContext_.restart();
    ioContext_.run_for(timeout);
    if (ioContext_.stopped()) {
        return true;
    }

    cancelPending();
    ioContext_.run();
    return false;
}

void AsioTransport::cancelPending() {
    std::visit(
        [](auto& stream) {
            boost::system::error_code ec;
            stream.cancel(ec);
        },
        stream_);
}

} // namespace transport
