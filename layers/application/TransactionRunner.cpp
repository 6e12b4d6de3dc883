#include "TransactionRunner.h"

#include <algorithm>
#include <iomanip>
#include <optional>
#include <sstream>

#include "layers/protocol/protocol_layer.h"

namespace application {

namespace {

// Upper bound on a single blocking receive, so cancellation is noticed promptly.
constexpr std::chrono::milliseconds kPollInterval{50};

std::string formatSeconds(std::chrono::steady_clock::duration elapsed) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << std::chrono::duration<double>(elapsed).count() << 's';
    return out.str();
}

std::string unitPrefix(const protocol::ModbusRequest& request) {
    return "Unit " + std::to_string(request.unitId) + ": ";
}

} // namespace

TransactionRunner::TransactionRunner(transport::Bus& bus, const protocol::IModbusCodec& codec)
    : bus_(bus), codec_(codec) {}

void TransactionRunner::setLogCallback(LogCallback cb) { onLog_ = std::move(cb); }

Outcome TransactionRunner::execute(const protocol::ModbusRequest& request) {
    const CancellationToken never;
    return run(request, never).outcome;
}

TransactionResult TransactionRunner::run(const protocol::ModbusRequest& request, const CancellationToken& cancel) {
    TransactionResult result;
    const auto started = std::chrono::steady_clock::now();
    const unsigned totalAttempts = 1 + request.maxRetries;

    for (unsigned n = 1; n <= totalAttempts; ++n) {
        if (cancel.isCancelled()) {
            result.abandoned = true;
            break;
        }

        result.attempts = n;
        log(unitPrefix(request) + "Attempt " + std::to_string(n) + "/" + std::to_string(totalAttempts));

        const auto attemptStarted = std::chrono::steady_clock::now();
        Outcome outcome = NoResponse{};
        const auto status = attempt(request, cancel, outcome);
        const auto attemptElapsed = std::chrono::steady_clock::now() - attemptStarted;

        if (status == AttemptStatus::Cancelled) {
            result.abandoned = true;
            break;
        }
        if (status == AttemptStatus::Answered) {
            if (isSuccess(outcome)) {
                log(unitPrefix(request) + "Response (" + formatSeconds(attemptElapsed) + ")");
            } else {
                log(unitPrefix(request) + "Error - " + describeOutcome(outcome) + " (" +
                    formatSeconds(attemptElapsed) + ")");
            }
            result.outcome = std::move(outcome);
            result.elapsed = std::chrono::steady_clock::now() - started;
            return result;
        }

        log(unitPrefix(request) + "Error - Timeout (" + formatSeconds(attemptElapsed) + ")");
    }

    result.outcome = NoResponse{};
    result.elapsed = std::chrono::steady_clock::now() - started;
    return result;
}

TransactionRunner::AttemptStatus TransactionRunner::attempt(const protocol::ModbusRequest& request,
                                                            const CancellationToken& cancel,
                                                            Outcome& outcome) {
    return bus_.multiplexed() ? attemptRouted(request, cancel, outcome) : attemptExclusive(request, cancel, outcome);
}

TransactionRunner::AttemptStatus TransactionRunner::attemptExclusive(const protocol::ModbusRequest& request,
                                                                     const CancellationToken& cancel,
                                                                     Outcome& outcome) {
    auto wire = bus_.claim([&cancel] { return cancel.isCancelled(); });
    if (!wire.owns_lock()) {
        return AttemptStatus::Cancelled;
    }

    auto& transport = bus_.transport();
    const auto transactionId = transport.nextTransactionId();
    const auto expected = protocol::expectedFrame(request, transactionId);
    // Without a transaction id a late reply to an earlier attempt would pass for this one.
    transport.flushInput();
    transport.send(codec_.encodeRequest(request, transactionId));

    const auto deadline = std::chrono::steady_clock::now() + request.timeout;
    std::vector<std::uint8_t> buffer;

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return AttemptStatus::TimedOut;
        }
        if (cancel.isCancelled()) {
            return AttemptStatus::Cancelled;
        }

        const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        auto chunk = transport.receive(std::min(remaining, kPollInterval));
        if (!chunk) {
            continue;
        }
        buffer.insert(buffer.end(), chunk->begin(), chunk->end());

        while (auto length = codec_.completeFrameLength(buffer)) {
            if (*length == 0 || *length > buffer.size()) {
                buffer.clear();
                break;
            }
            std::vector<std::uint8_t> frame(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(*length));
            buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(*length));

            if (accept(request, expected, frame, outcome)) {
                return AttemptStatus::Answered;
            }
        }
    }
}

TransactionRunner::AttemptStatus TransactionRunner::attemptRouted(const protocol::ModbusRequest& request,
                                                                  const CancellationToken& cancel,
                                                                  Outcome& outcome) {
    std::optional<transport::Bus::Mailbox> mailbox;
    std::uint16_t transactionId = 0;
    auto& transport = bus_.transport();
    {
        auto wire = bus_.claim([&cancel] { return cancel.isCancelled(); });
        if (!wire.owns_lock()) {
            return AttemptStatus::Cancelled;
        }
        transactionId = transport.nextTransactionId();
        mailbox.emplace(bus_, transactionId);
        transport.send(codec_.encodeRequest(request, transactionId));
    }
    const auto expected = protocol::expectedFrame(request, transactionId);
    const auto deadline = std::chrono::steady_clock::now() + request.timeout;

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return AttemptStatus::TimedOut;
        }
        if (cancel.isCancelled()) {
            return AttemptStatus::Cancelled;
        }

        const auto wait = std::min(std::chrono::ceil<std::chrono::milliseconds>(deadline - now), kPollInterval);
        // Another transaction may already have routed our reply.
        auto frame = mailbox->take(std::chrono::milliseconds(0));
        if (!frame) {
            auto reader = bus_.tryClaimReader();
            if (reader.owns_lock()) {
                if (auto chunk = transport.receive(wait)) {
                    auto& buffer = bus_.readBuffer();
                    buffer.insert(buffer.end(), chunk->begin(), chunk->end());
                    routeFrames(request);
                }
                reader.unlock();
                frame = mailbox->take(std::chrono::milliseconds(0));
            } else {
                frame = mailbox->take(wait);
            }
        }

        if (frame && accept(request, expected, *frame, outcome)) {
            return AttemptStatus::Answered;
        }
    }
}

void TransactionRunner::routeFrames(const protocol::ModbusRequest& request) {
    auto& buffer = bus_.readBuffer();
    while (auto length = codec_.completeFrameLength(buffer)) {
        if (*length == 0 || *length > buffer.size()) {
            buffer.clear();
            return;
        }
        std::vector<std::uint8_t> frame(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(*length));
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(*length));

        const auto decoded = codec_.decodeResponse(frame);
        if (const auto* invalid = std::get_if<protocol::InvalidFrame>(&decoded)) {
            log(unitPrefix(request) + "Discarding invalid frame [" + protocol::formatFrame(frame) + "]: " +
                invalid->reason);
            continue;
        }
        const auto transactionId = std::get<protocol::ModbusResponse>(decoded).transactionId;
        const auto text = protocol::formatFrame(frame);
        if (!bus_.route(transactionId, std::move(frame))) {
            log(unitPrefix(request) + "Discarding unmatched response [" + text + "]");
        }
    }
}

bool TransactionRunner::accept(const protocol::ModbusRequest& request,
                               const protocol::RequestFrame& expected,
                               const std::vector<std::uint8_t>& frame,
                               Outcome& outcome) const {
    const auto decoded = codec_.decodeResponse(frame);
    if (const auto* invalid = std::get_if<protocol::InvalidFrame>(&decoded)) {
        log(unitPrefix(request) + "Discarding invalid frame [" + protocol::formatFrame(frame) + "]: " +
            invalid->reason);
        return false;
    }

    const auto& response = std::get<protocol::ModbusResponse>(decoded);
    if (!codec_.matches(response, expected)) {
        log(unitPrefix(request) + "Discarding unmatched response [" + protocol::formatFrame(frame) + "]");
        return false;
    }

    if (!response.isException) {
        outcome = Success{response.data};
    } else if (protocol::isGatewayException(response.exceptionCode)) {
        outcome = GatewayError{response.exceptionCode};
    } else {
        outcome = DeviceError{response.exceptionCode};
    }
    return true;
}

void TransactionRunner::log(const std::string& message) const {
    if (onLog_) {
        onLog_(message);
    }
}

} // namespace application
