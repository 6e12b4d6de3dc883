#include "DeviceManager.h"

namespace application {

void DeviceManager::record(std::uint8_t unitId, const Outcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& device = devices_[unitId];
    device.unitId = unitId;
    device.record(outcome);
}

void DeviceManager::recordScan(const ScanResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [unitId, outcome] : result.outcomes) {
        auto& device = devices_[unitId];
        device.unitId = unitId;
        device.record(outcome);
    }
}

void DeviceManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
}

std::optional<Device> DeviceManager::findByUnit(std::uint8_t unitId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(unitId);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Device> DeviceManager::foundDevices() const {
    std::vector<Device> result;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [_, device] : devices_) {
        if (device.found) {
            result.push_back(device);
        }
    }
    return result;
}

std::vector<Device> DeviceManager::allDevices() const {
    std::vector<Device> result;
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(devices_.size());
    for (const auto& [_, device] : devices_) {
        result.push_back(device);
    }
    return result;
}

} // namespace application
