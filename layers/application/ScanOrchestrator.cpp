#include "ScanOrchestrator.h"

#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace application {

ScanOrchestrator::ScanOrchestrator(transport::Bus& bus, const protocol::IModbusCodec& codec)
    : runner_(bus, codec) {}

void ScanOrchestrator::setLogCallback(LogCallback cb) {
    onLog_ = cb;
    runner_.setLogCallback(std::move(cb));
}

ScanResult ScanOrchestrator::scan(std::uint8_t startUnit,
                                  std::uint8_t endUnit,
                                  const protocol::ModbusRequest& probeTemplate,
                                  unsigned concurrencyLimit,
                                  const CancellationToken& cancel,
                                  const OutcomeCallback& onOutcome) {
    if (startUnit < protocol::kMinUnitId || endUnit > protocol::kMaxUnitId || startUnit > endUnit) {
        throw std::invalid_argument("Unit id range must satisfy 1 <= start <= end <= 247");
    }

    const unsigned unitCount = static_cast<unsigned>(endUnit - startUnit) + 1;
    const unsigned workers = std::clamp(concurrencyLimit, 1U, unitCount);

    // Raised by the caller's token or by the first transport failure.
    CancellationToken stop(&cancel);
    std::mutex resultMutex;
    ScanResult result;
    std::exception_ptr failure;

    {
        boost::asio::thread_pool pool(workers);
        for (unsigned unit = startUnit; unit <= endUnit; ++unit) {
            boost::asio::post(pool, [&, unitId = static_cast<std::uint8_t>(unit)]() {
                if (stop.isCancelled()) {
                    return;
                }

                auto request = probeTemplate;
                request.unitId = unitId;

                try {
                    const auto transaction = runner_.run(request, stop);
                    if (transaction.abandoned) {
                        return;
                    }

                    std::lock_guard<std::mutex> lock(resultMutex);
                    result.outcomes[unitId] = transaction.outcome;
                    if (onOutcome) {
                        onOutcome(unitId, transaction.outcome);
                    }
                } catch (const std::exception&) {
                    // Transport failures and anything else a task throws end the scan.
                    std::lock_guard<std::mutex> lock(resultMutex);
                    if (!failure) {
                        failure = std::current_exception();
                    }
                    stop.cancel();
                }
            });
        }
        pool.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }

    result.complete = result.outcomes.size() == unitCount;
    if (!result.complete && onLog_) {
        onLog_("Scan cancelled after " + std::to_string(result.outcomes.size()) + " of " +
               std::to_string(unitCount) + " units");
    }
    return result;
}

} // namespace application
