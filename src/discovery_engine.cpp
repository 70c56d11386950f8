#include "discovery_engine.h"

#include "address_resolver.h"
#include "transaction_engine.h"

#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <set>
#include <utility>

namespace bacproxy {

namespace {

constexpr std::uint32_t kGlobalBroadcast = 0xFFFFFFFFU;

struct PreparedScan {
    std::optional<Ipv4Network> network;
    std::optional<InstanceRange> range;
    std::optional<Ipv4Endpoint> destination;
    std::string label;
};

Result<PreparedScan> prepareScan(const ScanTarget &target) {
    PreparedScan scan;
    if (target.network) {
        scan.network = parseCidr(*target.network);
        if (!scan.network) {
            return makeError(ErrorKind::InvalidScanTarget,
                             "'" + *target.network + "' is not an IPv4 address or CIDR block (a.b.c.d/0..32)");
        }
        scan.label = *target.network;
    }
    if (target.instances) {
        if (target.instances->low > target.instances->high || target.instances->high > kMaxInstance) {
            return makeError(ErrorKind::InvalidScanTarget, "instance range must satisfy 0 <= low <= high <= 4194303");
        }
        scan.range = target.instances;
    }
    if (target.destination) {
        scan.destination = parseDeviceAddress(*target.destination);
        if (!scan.destination) {
            return makeError(ErrorKind::InvalidScanTarget, "'" + *target.destination + "' is not an IPv4 address");
        }
        if (scan.label.empty()) {
            scan.label = *target.destination;
        }
    }
    if (scan.label.empty()) {
        scan.label = formatIp(kGlobalBroadcast);
    }
    return scan;
}

// Collects I-Am replies for one discovery window.
class ScanWindow : public AnnouncementListener {
  public:
    ScanWindow(const PreparedScan &scan, std::vector<std::shared_ptr<DiscoveryObserver>> observers)
        : network(scan.network), range(scan.range), label(scan.label), observers(std::move(observers)) {}

    void onAnnouncement(const Ipv4Endpoint &source, const codec::IAm &iam) override {
        if (network && !network->contains(source.ip)) {
            std::cout << "[Discovery] Ignoring I-Am from " << formatDeviceAddress(source) << " (device "
                      << iam.deviceInstance << "): outside " << network->describe() << std::endl;
            return;
        }
        if (range && (iam.deviceInstance < range->low || iam.deviceInstance > range->high)) {
            return;
        }

        DeviceAnnouncement announcement;
        announcement.source = source;
        announcement.deviceId = ObjectId{object_type::kDevice, iam.deviceInstance};
        announcement.maxApdu = iam.maxApdu;
        announcement.segmentation = iam.segmentation;
        announcement.vendorId = iam.vendorId;
        announcement.scannedTarget = label;
        {
            std::lock_guard lock(mtx);
            if (closed || !seen.insert({source, iam.deviceInstance}).second) {
                return;
            }
            accepted.push_back(announcement);
        }
        for (const auto &observer : observers) {
            observer->onDeviceAnnounced(announcement);
        }
    }

    void onStopped() override {
        std::lock_guard lock(mtx);
        stopped = true;
        cv.notify_all();
    }

    // True when the proxy stopped before the deadline.
    bool waitUntil(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock lock(mtx);
        cv.wait_until(lock, deadline, [this]() { return stopped; });
        return stopped;
    }

    std::vector<DeviceAnnouncement> close() {
        std::lock_guard lock(mtx);
        closed = true;
        return accepted;
    }

  private:
    std::optional<Ipv4Network> network;
    std::optional<InstanceRange> range;
    std::string label;
    std::vector<std::shared_ptr<DiscoveryObserver>> observers;

    std::mutex mtx;
    std::condition_variable cv;
    std::set<std::pair<Ipv4Endpoint, std::uint32_t>> seen;
    std::vector<DeviceAnnouncement> accepted;
    bool stopped{false};
    bool closed{false};
};

} // namespace

DiscoveryEngine &DiscoveryEngine::instance() {
    static DiscoveryEngine engine(BacnetProxy::instance());
    return engine;
}

DiscoveryEngine::DiscoveryEngine(BacnetProxy &proxy, DeviceRegistry &registry) : proxy(proxy), registry(registry) {}

void DiscoveryEngine::addObserver(std::shared_ptr<DiscoveryObserver> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard lock(observerMtx);
    observers.push_back(std::move(observer));
}

void DiscoveryEngine::removeObserver(const std::shared_ptr<DiscoveryObserver> &observer) {
    std::lock_guard lock(observerMtx);
    observers.erase(std::remove(observers.begin(), observers.end(), observer), observers.end());
}

std::vector<std::shared_ptr<DiscoveryObserver>> DiscoveryEngine::observersSnapshot() const {
    std::lock_guard lock(observerMtx);
    return observers;
}

Result<std::vector<DeviceAnnouncement>> DiscoveryEngine::scanRange(const ScanTarget &target,
                                                                  const ScanOptions &options) {
    auto prepared = prepareScan(target);
    if (!prepared) {
        return prepared.error();
    }
    if (options.window && options.window->count() < 0) {
        return makeError(ErrorKind::InvalidScanTarget, "scan window must not be negative");
    }
    auto sessionResult = proxy.session();
    if (!sessionResult) {
        return sessionResult.error();
    }
    auto session = sessionResult.value();
    const auto &scan = prepared.value();
    const auto window = std::min(options.window.value_or(session->config().scanWindow), kMaxScanWindow);

    Ipv4Endpoint destination{kGlobalBroadcast, session->config().port};
    bool broadcast = true;
    if (scan.destination) {
        destination = *scan.destination;
        broadcast = destination.ip == kGlobalBroadcast || (destination.ip & 0xFFU) == 0xFFU;
    } else if (scan.network) {
        destination.ip = discoveryAddressFor(*scan.network);
        broadcast = scan.network->prefixLength < 31;
    }

    const auto observerList = observersSnapshot();
    std::vector<DeviceAnnouncement> devices;
    {
        std::lock_guard scanLock(session->scanMutex());
        auto listener = std::make_shared<ScanWindow>(scan, observerList);
        auto registration = session->exchanges().attach(listener);
        if (!registration) {
            return registration.error();
        }

        for (const auto &observer : observerList) {
            observer->onScanStarted(scan.label);
        }
        std::cout << "[Discovery] Who-Is to " << formatDeviceAddress(destination) << " for " << scan.label
                  << " (window " << window.count() << " ms)" << std::endl;
        auto sent = session->send(destination, codec::encodeWhoIs(scan.range, broadcast));
        if (!sent) {
            std::cerr << "[Discovery] Who-Is failed: " << sent.error().describe() << std::endl;
            return sent.error();
        }

        if (listener->waitUntil(std::chrono::steady_clock::now() + window)) {
            listener->close();
            std::cout << "[Discovery] Scan of " << scan.label << " aborted: proxy stopped" << std::endl;
            return makeError(ErrorKind::ProxyStopped, "proxy stopped during the discovery window");
        }
        devices = listener->close();
    }

    if (options.resolveNames) {
        if (auto resolved = resolveNames(devices); !resolved) {
            std::cout << "[Discovery] Scan of " << scan.label << " aborted while reading names: "
                      << resolved.error().describe() << std::endl;
            return makeError(ErrorKind::ProxyStopped, "proxy stopped while reading device names");
        }
    }

    registry.replace(scan.label, devices);
    for (const auto &observer : observerList) {
        observer->onScanFinished(scan.label, devices.size());
    }
    std::cout << "[Discovery] Scan of " << scan.label << " finished: " << devices.size() << " device(s)" << std::endl;
    return devices;
}

Result<std::vector<DeviceAnnouncement>> DiscoveryEngine::whoIs(std::optional<std::uint32_t> low,
                                                               std::optional<std::uint32_t> high,
                                                               std::optional<std::string> destination,
                                                               const ScanOptions &options) {
    if (low.has_value() != high.has_value()) {
        return makeError(ErrorKind::InvalidScanTarget, "low and high limits must be given together");
    }
    std::optional<InstanceRange> range;
    if (low) {
        range = InstanceRange{*low, *high};
    }
    if (!destination || destination->empty()) {
        destination = formatIp(kGlobalBroadcast);
    }
    return scanRange(ScanTarget::forRange(range, std::move(destination)), options);
}

Result<Acknowledged> DiscoveryEngine::resolveNames(std::vector<DeviceAnnouncement> &devices) {
    TransactionEngine transactions(proxy);
    for (auto &device : devices) {
        auto name = transactions.readProperty(
            PropertyReference{device.source, device.deviceId, property_id::kObjectName, std::nullopt});
        if (!name) {
            const auto kind = name.error().kind;
            if (kind == ErrorKind::ProxyStopped || kind == ErrorKind::ProxyNotRunning) {
                return name.error();
            }
            continue;
        }
        if (const auto *primitive = std::get_if<PrimitiveValue>(&name.value())) {
            if (const auto *text = std::get_if<std::string>(primitive)) {
                device.objectName = *text;
            }
        }
    }
    return Acknowledged{};
}

} // namespace bacproxy
