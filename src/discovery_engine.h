#pragma once

#include "bacnet_proxy.h"
#include "bacnet_types.h"
#include "device_registry.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bacproxy {

constexpr std::chrono::milliseconds kMaxScanWindow{std::chrono::seconds(60)};

// Live feed of discovery activity (the WebSocket hub subscribes to it).
class DiscoveryObserver {
  public:
    virtual ~DiscoveryObserver() = default;

    virtual void onScanStarted(const std::string &target) = 0;
    // Called on the proxy worker thread as each accepted I-Am arrives.
    virtual void onDeviceAnnounced(const DeviceAnnouncement &announcement) = 0;
    virtual void onScanFinished(const std::string &target, std::size_t deviceCount) = 0;
};

struct ScanOptions {
    // Defaults to the proxy's configured scan window; capped at kMaxScanWindow.
    std::optional<std::chrono::milliseconds> window;
    // Read object-name from every announced device once the window closes.
    bool resolveNames{false};
};

/**
 * Who-Is based device discovery.
 *
 * One scan runs at a time per proxy session; a second caller waits for the
 * first window to close. Replies are deduplicated by (source address, device
 * instance), first arrival wins, and results keep arrival order. A finished
 * scan replaces the contents of the device registry.
 */
class DiscoveryEngine {
  public:
    static DiscoveryEngine &instance();

    explicit DiscoveryEngine(BacnetProxy &proxy, DeviceRegistry &registry = DeviceRegistry::instance());

    Result<std::vector<DeviceAnnouncement>> scanRange(const ScanTarget &target, const ScanOptions &options = {});
    Result<std::vector<DeviceAnnouncement>> whoIs(std::optional<std::uint32_t> low, std::optional<std::uint32_t> high,
                                                  std::optional<std::string> destination,
                                                  const ScanOptions &options = {});

    void addObserver(std::shared_ptr<DiscoveryObserver> observer);
    void removeObserver(const std::shared_ptr<DiscoveryObserver> &observer);

  private:
    std::vector<std::shared_ptr<DiscoveryObserver>> observersSnapshot() const;
    // Fails only when the proxy goes away; unreadable names are left empty.
    Result<Acknowledged> resolveNames(std::vector<DeviceAnnouncement> &devices);

    BacnetProxy &proxy;
    DeviceRegistry &registry;
    mutable std::mutex observerMtx;
    std::vector<std::shared_ptr<DiscoveryObserver>> observers;
};

} // namespace bacproxy
