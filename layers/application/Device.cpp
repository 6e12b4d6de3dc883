#include "Device.h"

namespace application {

void Device::record(const Outcome& outcome) {
    if (isSuccess(outcome)) {
        ++successCount;
    } else {
        ++failCount;
    }
    // A unit that answered once stays found even if it goes quiet later.
    found = found || isDeviceFound(outcome);
    lastStatus = outcomeStatus(outcome);
    lastDetail = describeOutcome(outcome);
}

} // namespace application
