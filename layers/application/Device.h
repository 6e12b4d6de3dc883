#pragma once

#include <cstdint>
#include <string>

#include "Outcome.h"

namespace application {

// What is known about one unit id from the scans and reads issued so far.
struct Device {
    std::uint8_t unitId = 0;
    std::uint64_t successCount = 0;
    std::uint64_t failCount = 0;
    bool found = false;
    std::string lastStatus;
    std::string lastDetail;

    void record(const Outcome& outcome);
};

} // namespace application
