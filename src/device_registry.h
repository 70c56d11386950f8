#pragma once

#include "bacnet_types.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace bacproxy {

// Devices announced during the most recent scan. Process lifetime only.
class DeviceRegistry {
  public:
    static DeviceRegistry &instance();

    DeviceRegistry() = default;

    void replace(const std::string &scanTarget, std::vector<DeviceAnnouncement> announcements);
    void clear();

    [[nodiscard]] std::vector<DeviceAnnouncement> list() const;
    [[nodiscard]] std::optional<DeviceAnnouncement> findByInstance(std::uint32_t instance) const;
    [[nodiscard]] std::optional<DeviceAnnouncement> findByAddress(const Ipv4Endpoint &address) const;
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::string lastScanTarget() const;
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> lastScanTime() const;

  private:
    mutable std::shared_mutex mtx;
    std::vector<DeviceAnnouncement> devices;
    std::string scanTarget;
    std::optional<std::chrono::system_clock::time_point> scannedAt;
};

} // namespace bacproxy
