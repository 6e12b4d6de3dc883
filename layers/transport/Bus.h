#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "ITransport.h"

namespace transport {

// Shared connection for logically concurrent transactions.
//
// RTU frames carry no transaction id, so a reply can only be told apart by unit
// and function: an RTU or RTU-over-TCP bus carries one whole exchange at a time.
// An MBAP (TCP) bus is multiplexed: the wire is held only while a request is
// written, one waiting transaction at a time reads the connection, and every
// reply is routed to the mailbox registered for its transaction id.
class Bus {
public:
    explicit Bus(ITransport& transport);

    Bus(const Bus&) = delete;
    Bus& operator=(const Bus&) = delete;

    ITransport& transport() noexcept { return transport_; }
    bool multiplexed() const noexcept { return multiplexed_; }

    // Write access (the whole exchange on a non-multiplexed bus). Returns an
    // unlocked guard if `stopRequested` turns true while waiting.
    std::unique_lock<std::timed_mutex> claim(const std::function<bool()>& stopRequested);

    // Reader role on a multiplexed bus; unlocked if another transaction is reading.
    std::unique_lock<std::mutex> tryClaimReader();
    // Bytes read but not yet framed. Only touched while holding the reader role.
    std::vector<std::uint8_t>& readBuffer() noexcept { return readBuffer_; }

    // Hands `frame` to the transaction waiting for `transactionId`; false if none is.
    bool route(std::uint16_t transactionId, std::vector<std::uint8_t> frame);

    // Registration of one outstanding transaction id, released on destruction.
    class Mailbox {
    public:
        Mailbox(Bus& bus, std::uint16_t transactionId);
        ~Mailbox();

        Mailbox(const Mailbox&) = delete;
        Mailbox& operator=(const Mailbox&) = delete;

        // Waits up to `timeout` for a routed frame.
        std::optional<std::vector<std::uint8_t>> take(std::chrono::milliseconds timeout);

    private:
        Bus& bus_;
        std::uint16_t transactionId_;
    };

private:
    ITransport& transport_;
    const bool multiplexed_;
    std::timed_mutex wireMutex_;
    std::mutex readerMutex_;
    std::vector<std::uint8_t> readBuffer_;

    std::mutex inboxMutex_;
    std::condition_variable inboxCv_;
    std::map<std::uint16_t, std::deque<std::vector<std::uint8_t>>> inbox_;
};

} // namespace transport
