#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "Device.h"

namespace application {

// Per-unit success/failure counters, fed with every completed scan or read.
class DeviceManager {
public:
    void record(std::uint8_t unitId, const Outcome& outcome);
    void recordScan(const ScanResult& result);
    void clear();

    std::optional<Device> findByUnit(std::uint8_t unitId) const;
    std::vector<Device> foundDevices() const;
    std::vector<Device> allDevices() const;

private:
    mutable std::mutex mutex_;
    std::map<std::uint8_t, Device> devices_;
};

} // namespace application
