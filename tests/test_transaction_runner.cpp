#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/transport/InMemoryModbusTransport.h"
#include "layers/application/TransactionRunner.h"
#include "layers/protocol/protocol_layer.h"

using application::CancellationToken;
using application::DeviceError;
using application::GatewayError;
using application::NoResponse;
using application::Success;
using application::TransactionRunner;
using namespace std::chrono_literals;
using transport::ConnectionType;
using transport::DeviceBehavior;
using transport::InMemoryModbusTransport;
using transport::SimulatedDevice;

namespace {

protocol::ModbusRequest probe(std::uint8_t unitId, std::chrono::milliseconds timeout, unsigned retries) {
    protocol::ModbusRequest request;
    request.unitId = unitId;
    request.startAddress = 0;
    request.count = 1;
    request.timeout = timeout;
    request.maxRetries = retries;
    return request;
}

SimulatedDevice device(DeviceBehavior behavior, std::uint16_t fillValue = 0,
                       std::chrono::milliseconds delay = 0ms, std::uint8_t exceptionCode = 0x02) {
    SimulatedDevice d;
    d.behavior = behavior;
    d.fillValue = fillValue;
    d.delay = delay;
    d.exceptionCode = exceptionCode;
    return d;
}

// Owns the simulated bus together with the codec and runner that talk to it.
class RunnerFixture : public ::testing::Test {
protected:
    explicit RunnerFixture(ConnectionType framing = ConnectionType::Tcp)
        : transport_(framing),
          codec_(protocol::makeCodec(framing)),
          bus_(transport_),
          runner_(bus_, *codec_) {
        runner_.setLogCallback([this](const std::string& line) { logs_.push_back(line); });
    }

    bool logged(const std::string& prefix) const {
        for (const auto& line : logs_) {
            if (line.rfind(prefix, 0) == 0) {
                return true;
            }
        }
        return false;
    }

    InMemoryModbusTransport transport_;
    std::unique_ptr<protocol::IModbusCodec> codec_;
    transport::Bus bus_;
    TransactionRunner runner_;
    std::vector<std::string> logs_;
};

class RtuRunnerFixture : public RunnerFixture {
protected:
    RtuRunnerFixture() : RunnerFixture(ConnectionType::Rtu) {}
};

} // namespace

TEST_F(RunnerFixture, HealthyDeviceSucceedsWithOneRequest) {
    transport_.addDevice(1, device(DeviceBehavior::Healthy, 1111));

    const auto outcome = runner_.execute(probe(1, 500ms, 2));

    ASSERT_TRUE(std::holds_alternative<Success>(outcome));
    EXPECT_EQ((std::vector<std::uint16_t>{1111}), protocol::toRegisters(std::get<Success>(outcome).rawBytes));
    EXPECT_EQ(1U, transport_.requestCount(1));
}

TEST_F(RunnerFixture, ReadsInputRegistersSeparately) {
    transport_.addDevice(9, device(DeviceBehavior::Healthy, 0));
    transport_.setRegister(9, true, 100, 0xCAFE);
    transport_.setRegister(9, false, 100, 0x0BAD);

    auto request = probe(9, 500ms, 0);
    request.registerType = protocol::RegisterType::Input;
    request.startAddress = 100;
    request.count = 2;

    const auto outcome = runner_.execute(request);
    ASSERT_TRUE(std::holds_alternative<Success>(outcome));
    EXPECT_EQ((std::vector<std::uint16_t>{0xCAFE, 0x0000}),
              protocol::toRegisters(std::get<Success>(outcome).rawBytes));
}

TEST_F(RunnerFixture, DeviceExceptionIsNotRetried) {
    transport_.addDevice(2, device(DeviceBehavior::RegisterError, 0, 0ms, 0x02));

    const auto result = runner_.run(probe(2, 500ms, 3), CancellationToken{});

    ASSERT_TRUE(std::holds_alternative<DeviceError>(result.outcome));
    EXPECT_EQ(0x02, std::get<DeviceError>(result.outcome).exceptionCode);
    EXPECT_EQ(1U, result.attempts);
    EXPECT_EQ(1U, transport_.requestCount(2));
    EXPECT_TRUE(logged("Unit 2: Error - Exception Code 2"));
}

TEST_F(RunnerFixture, GatewayExceptionCodesAreGatewayErrors) {
    transport_.addDevice(4, device(DeviceBehavior::GatewayError, 0, 0ms, 0x0B));
    transport_.addDevice(7, device(DeviceBehavior::GatewayError, 0, 0ms, 0x0A));

    const auto targetFailed = runner_.execute(probe(4, 500ms, 2));
    ASSERT_TRUE(std::holds_alternative<GatewayError>(targetFailed));
    EXPECT_EQ(0x0B, std::get<GatewayError>(targetFailed).code);

    const auto pathUnavailable = runner_.execute(probe(7, 500ms, 2));
    ASSERT_TRUE(std::holds_alternative<GatewayError>(pathUnavailable));
    EXPECT_EQ(0x0A, std::get<GatewayError>(pathUnavailable).code);

    EXPECT_EQ(1U, transport_.requestCount(4));
    EXPECT_EQ(1U, transport_.requestCount(7));
}

TEST_F(RunnerFixture, SilentDeviceExhaustsEveryAttempt) {
    transport_.addDevice(3, device(DeviceBehavior::Silent));

    const auto result = runner_.run(probe(3, 100ms, 2), CancellationToken{});

    EXPECT_TRUE(std::holds_alternative<NoResponse>(result.outcome));
    EXPECT_FALSE(result.abandoned);
    EXPECT_EQ(3U, result.attempts);
    EXPECT_EQ(3U, transport_.requestCount(3));
    EXPECT_GE(result.elapsed, 300ms);
}

TEST_F(RunnerFixture, AbsentUnitReportsNoResponse) {
    const auto result = runner_.run(probe(200, 50ms, 1), CancellationToken{});

    EXPECT_TRUE(std::holds_alternative<NoResponse>(result.outcome));
    EXPECT_EQ(2U, transport_.requestCount(200));
}

TEST_F(RunnerFixture, FlakyDeviceRecoversOnRetry) {
    transport_.addDevice(6, device(DeviceBehavior::Flaky, 123, 2000ms));

    const auto result = runner_.run(probe(6, 300ms, 1), CancellationToken{});

    ASSERT_TRUE(std::holds_alternative<Success>(result.outcome));
    EXPECT_EQ((std::vector<std::uint16_t>{123}), protocol::toRegisters(std::get<Success>(result.outcome).rawBytes));
    EXPECT_EQ(2U, result.attempts);
    EXPECT_EQ(2U, transport_.requestCount(6));

    EXPECT_TRUE(logged("Unit 6: Attempt 1/2"));
    EXPECT_TRUE(logged("Unit 6: Error - Timeout ("));
    EXPECT_TRUE(logged("Unit 6: Attempt 2/2"));
    EXPECT_TRUE(logged("Unit 6: Response ("));
}

TEST_F(RunnerFixture, FlakyDeviceWithoutRetriesIsNoResponse) {
    transport_.addDevice(6, device(DeviceBehavior::Flaky, 123, 2000ms));

    EXPECT_TRUE(std::holds_alternative<NoResponse>(runner_.execute(probe(6, 200ms, 0))));
    EXPECT_EQ(1U, transport_.requestCount(6));
}

TEST_F(RunnerFixture, SlowDeviceDependsOnTimeout) {
    transport_.addDevice(5, device(DeviceBehavior::Slow, 5555, 200ms));

    EXPECT_TRUE(std::holds_alternative<Success>(runner_.execute(probe(5, 600ms, 0))));
    EXPECT_TRUE(std::holds_alternative<NoResponse>(runner_.execute(probe(5, 50ms, 0))));
}

TEST_F(RunnerFixture, StaleTransactionIdIsDiscarded) {
    transport_.addDevice(1, device(DeviceBehavior::Healthy, 1111));

    protocol::ModbusResponse stale;
    stale.transactionId = 999;
    stale.unitId = 1;
    stale.functionCode = 0x03;
    stale.data = protocol::fromRegisters({4242});
    transport_.injectFrame(protocol::TcpCodec().encodeResponse(stale));

    const auto outcome = runner_.execute(probe(1, 500ms, 0));

    ASSERT_TRUE(std::holds_alternative<Success>(outcome));
    EXPECT_EQ((std::vector<std::uint16_t>{1111}), protocol::toRegisters(std::get<Success>(outcome).rawBytes));
    EXPECT_TRUE(logged("Unit 1: Discarding unmatched response"));
}

TEST_F(RtuRunnerFixture, CorruptFrameDoesNotEndTransaction) {
    transport_.addDevice(1, device(DeviceBehavior::Slow, 0x04D2, 100ms));
    transport_.injectFrame({0x01, 0x03, 0x02, 0x04, 0xD2, 0xFF, 0xFF}, 20ms);

    const auto outcome = runner_.execute(probe(1, 500ms, 0));

    ASSERT_TRUE(std::holds_alternative<Success>(outcome));
    EXPECT_EQ((std::vector<std::uint16_t>{0x04D2}), protocol::toRegisters(std::get<Success>(outcome).rawBytes));
    EXPECT_TRUE(logged("Unit 1: Discarding invalid frame"));
}

TEST_F(RtuRunnerFixture, CorruptFrameAloneFallsThroughToTimeout) {
    transport_.addDevice(1, device(DeviceBehavior::Silent));
    transport_.injectFrame({0x01, 0x03, 0x02, 0x04, 0xD2, 0xFF, 0xFF}, 20ms);

    const auto result = runner_.run(probe(1, 100ms, 1), CancellationToken{});

    EXPECT_TRUE(std::holds_alternative<NoResponse>(result.outcome));
    EXPECT_EQ(2U, transport_.requestCount(1));
    EXPECT_TRUE(logged("Unit 1: Discarding invalid frame"));
}

TEST_F(RtuRunnerFixture, ResponseFromAnotherUnitIsDiscarded) {
    transport_.addDevice(1, device(DeviceBehavior::Silent));

    protocol::ModbusResponse other;
    other.unitId = 2;
    other.functionCode = 0x03;
    other.data = protocol::fromRegisters({1});
    transport_.injectFrame(protocol::RtuCodec().encodeResponse(other), 20ms);

    EXPECT_TRUE(std::holds_alternative<NoResponse>(runner_.execute(probe(1, 100ms, 0))));
    EXPECT_TRUE(logged("Unit 1: Discarding unmatched response"));
}

TEST_F(RtuRunnerFixture, BufferedReplyIsFlushedBeforeSending) {
    transport_.addDevice(1, device(DeviceBehavior::Healthy, 1111));

    protocol::ModbusResponse leftover;
    leftover.unitId = 1;
    leftover.functionCode = 0x03;
    leftover.data = protocol::fromRegisters({4242});
    transport_.injectFrame(protocol::RtuCodec().encodeResponse(leftover));

    const auto outcome = runner_.execute(probe(1, 500ms, 0));

    ASSERT_TRUE(std::holds_alternative<Success>(outcome));
    EXPECT_EQ((std::vector<std::uint16_t>{1111}), protocol::toRegisters(std::get<Success>(outcome).rawBytes));
}

TEST_F(RtuRunnerFixture, LateReplyToEarlierAttemptIsNotAccepted) {
    // Answers 2 s after each request; four 700 ms attempts span past the first answer.
    transport_.addDevice(3, device(DeviceBehavior::Silent, 3333, 2000ms));

    const auto result = runner_.run(probe(3, 700ms, 3), CancellationToken{});

    EXPECT_TRUE(std::holds_alternative<NoResponse>(result.outcome));
    EXPECT_EQ(4U, result.attempts);
    EXPECT_EQ(4U, transport_.requestCount(3));
}

TEST_F(RtuRunnerFixture, FlakyDeviceRecoversOverRtu) {
    transport_.addDevice(6, device(DeviceBehavior::Flaky, 123, 2000ms));

    const auto result = runner_.run(probe(6, 300ms, 3), CancellationToken{});

    ASSERT_TRUE(std::holds_alternative<Success>(result.outcome));
    EXPECT_EQ(2U, result.attempts);
    EXPECT_EQ(2U, transport_.requestCount(6));
}

TEST_F(RunnerFixture, TransportFailurePropagates) {
    transport_.addDevice(1, device(DeviceBehavior::Healthy, 1));
    transport_.breakConnection("Connection closed by peer");

    EXPECT_THROW(runner_.execute(probe(1, 100ms, 3)), transport::TransportError);
}

TEST_F(RunnerFixture, CancellationAbandonsInFlightAttempt) {
    transport_.addDevice(3, device(DeviceBehavior::Silent));
    CancellationToken cancel;

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(100ms);
        cancel.cancel();
    });
    const auto result = runner_.run(probe(3, 5000ms, 2), cancel);
    canceller.join();

    EXPECT_TRUE(result.abandoned);
    EXPECT_EQ(1U, result.attempts);
    EXPECT_LT(result.elapsed, 2000ms);
}

TEST_F(RunnerFixture, AlreadyCancelledTokenSendsNothing) {
    transport_.addDevice(1, device(DeviceBehavior::Healthy, 1));
    CancellationToken cancel;
    cancel.cancel();

    const auto result = runner_.run(probe(1, 100ms, 0), cancel);

    EXPECT_TRUE(result.abandoned);
    EXPECT_EQ(0U, transport_.totalRequests());
}

TEST(CancellationToken, FollowsParent) {
    CancellationToken parent;
    CancellationToken child(&parent);
    EXPECT_FALSE(child.isCancelled());

    parent.cancel();
    EXPECT_TRUE(child.isCancelled());

    parent.reset();
    EXPECT_FALSE(child.isCancelled());
    child.cancel();
    EXPECT_TRUE(child.isCancelled());
    EXPECT_FALSE(parent.isCancelled());
}

TEST(Bus, OnlyMbapFramingIsMultiplexed) {
    InMemoryModbusTransport tcp(ConnectionType::Tcp);
    InMemoryModbusTransport rtu(ConnectionType::Rtu);
    InMemoryModbusTransport rtuOverTcp(ConnectionType::RtuOverTcp);

    EXPECT_TRUE(transport::Bus(tcp).multiplexed());
    EXPECT_FALSE(transport::Bus(rtu).multiplexed());
    EXPECT_FALSE(transport::Bus(rtuOverTcp).multiplexed());
}

TEST(Bus, RoutesFramesOnlyToRegisteredTransactions) {
    InMemoryModbusTransport tcp(ConnectionType::Tcp);
    transport::Bus bus(tcp);

    EXPECT_FALSE(bus.route(7, {0x01}));
    {
        transport::Bus::Mailbox mailbox(bus, 7);
        EXPECT_FALSE(mailbox.take(0ms).has_value());
        EXPECT_TRUE(bus.route(7, {0x01, 0x02}));
        const auto frame = mailbox.take(10ms);
        ASSERT_TRUE(frame.has_value());
        EXPECT_EQ((std::vector<std::uint8_t>{0x01, 0x02}), *frame);
    }
    EXPECT_FALSE(bus.route(7, {0x03}));
}
