#include "device_registry.h"

#include <algorithm>
#include <mutex>

namespace bacproxy {

DeviceRegistry &DeviceRegistry::instance() {
    static DeviceRegistry registry;
    return registry;
}

void DeviceRegistry::replace(const std::string &target, std::vector<DeviceAnnouncement> announcements) {
    std::unique_lock lock(mtx);
    devices = std::move(announcements);
    scanTarget = target;
    scannedAt = std::chrono::system_clock::now();
}

void DeviceRegistry::clear() {
    std::unique_lock lock(mtx);
    devices.clear();
    scanTarget.clear();
    scannedAt.reset();
}

std::vector<DeviceAnnouncement> DeviceRegistry::list() const {
    std::shared_lock lock(mtx);
    return devices;
}

std::optional<DeviceAnnouncement> DeviceRegistry::findByInstance(std::uint32_t instance) const {
    std::shared_lock lock(mtx);
    const auto it = std::find_if(devices.begin(), devices.end(),
                                 [instance](const DeviceAnnouncement &d) { return d.deviceId.instance == instance; });
    if (it == devices.end()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<DeviceAnnouncement> DeviceRegistry::findByAddress(const Ipv4Endpoint &address) const {
    std::shared_lock lock(mtx);
    const auto it = std::find_if(devices.begin(), devices.end(),
                                 [&address](const DeviceAnnouncement &d) { return d.source == address; });
    if (it == devices.end()) {
        return std::nullopt;
    }
    return *it;
}

std::size_t DeviceRegistry::size() const {
    std::shared_lock lock(mtx);
    return devices.size();
}

std::string DeviceRegistry::lastScanTarget() const {
    std::shared_lock lock(mtx);
    return scanTarget;
}

std::optional<std::chrono::system_clock::time_point> DeviceRegistry::lastScanTime() const {
    std::shared_lock lock(mtx);
    return scannedAt;
}

} // namespace bacproxy
