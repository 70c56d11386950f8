#include "bacnet_proxy.h"
#include "controllers/Responses.h"
#include "plugins/DiscoveryHub.h"
#include "property_profile.h"

#include <drogon/drogon.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

struct CliOptions {
    std::uint16_t port{8080};
    std::uint16_t threads{0};
    std::uint32_t engineThreads{8};
    std::uint16_t bacnetPort{bacproxy::kDefaultBacnetPort};
    std::string bindAddress;
    std::string iface;
    std::string resolverTarget{"8.8.8.8"};
    std::uint32_t apduTimeoutMs{3000};
    std::uint32_t apduRetries{0};
    std::uint32_t scanWindowMs{3000};
    std::string profilePath;
    bool autostart{false};
    bool showHelp{false};
};

std::optional<std::uint16_t> parsePort(const std::string &value) {
    try {
        const auto num = std::stoul(value);
        if (num > 0 && num <= 65535) {
            return static_cast<std::uint16_t>(num);
        }
    } catch (const std::exception &) {
    }
    return std::nullopt;
}

std::optional<std::uint32_t> parseUint(const std::string &value) {
    try {
        return static_cast<std::uint32_t>(std::stoul(value));
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

bool parseBool(const std::string &value) {
    std::string lowered(value.size(), '\0');
    std::transform(value.begin(), value.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

std::optional<std::string> readEnv(const char *name) {
    if (const char *value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
}

void readUintEnv(const char *name, std::uint32_t &target) {
    if (auto env = readEnv(name)) {
        if (auto parsed = parseUint(*env)) {
            target = *parsed;
        } else {
            std::cerr << "Ignoring " << name << "='" << *env << "': not an unsigned integer" << std::endl;
        }
    }
}

bool portAvailable(std::uint16_t port) {
    const auto sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        return true;
    }

    int reuse = 1;
    (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
    (void)setsockopt(sock, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    const bool available = ::bind(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
    ::close(sock);
    return available;
}

void printUsage(const char *exe) {
    std::cout << "Usage: " << exe << " [options]\n"
              << "Options:\n"
              << "  --port <port>            TCP port for the HTTP API (env: PORT or DROGON_PORT)\n"
              << "  --threads <n>            Worker threads for Drogon (default: hardware concurrency)\n"
              << "  --engine-threads <n>     Threads that run scans and transactions\n"
              << "                           (env: BACNET_ENGINE_THREADS, default 8)\n"
              << "  --bacnet-port <port>     UDP port for BACnet/IP (env: BACNET_PORT, default 47808)\n"
              << "  --bind <ip>              Local address to start on (env: BACNET_BIND_ADDRESS)\n"
              << "  --iface <name>           Interface whose address is used (env: BACNET_IFACE)\n"
              << "  --resolver-target <ip>   Address used to pick the outbound interface\n"
              << "                           (env: BACNET_RESOLVER_TARGET, default 8.8.8.8)\n"
              << "  --apdu-timeout-ms <ms>   Confirmed request timeout (env: BACNET_APDU_TIMEOUT_MS)\n"
              << "  --apdu-retries <n>       Read retries after a timeout (env: BACNET_APDU_RETRIES)\n"
              << "  --scan-window-ms <ms>    Default discovery window (env: BACNET_SCAN_WINDOW_MS)\n"
              << "  --profile <path>         XML property profile for read_device_all (env: BACNET_PROFILE_PATH)\n"
              << "  --autostart              Start the BACnet endpoint at launch (env: BACNET_AUTOSTART)\n"
              << "  --help                   Show this help message\n";
}

CliOptions parseArgs(int argc, char **argv) {
    CliOptions opts;

    if (auto envPort = readEnv("PORT"); envPort && parsePort(*envPort)) {
        opts.port = *parsePort(*envPort);
    } else if (auto envPortD = readEnv("DROGON_PORT"); envPortD && parsePort(*envPortD)) {
        opts.port = *parsePort(*envPortD);
    }
    if (auto envBacnetPort = readEnv("BACNET_PORT"); envBacnetPort && parsePort(*envBacnetPort)) {
        opts.bacnetPort = *parsePort(*envBacnetPort);
    }
    if (auto envBind = readEnv("BACNET_BIND_ADDRESS")) {
        opts.bindAddress = *envBind;
    }
    if (auto envIface = readEnv("BACNET_IFACE")) {
        opts.iface = *envIface;
    }
    if (auto envResolver = readEnv("BACNET_RESOLVER_TARGET")) {
        opts.resolverTarget = *envResolver;
    }
    readUintEnv("BACNET_APDU_TIMEOUT_MS", opts.apduTimeoutMs);
    readUintEnv("BACNET_APDU_RETRIES", opts.apduRetries);
    readUintEnv("BACNET_SCAN_WINDOW_MS", opts.scanWindowMs);
    readUintEnv("BACNET_ENGINE_THREADS", opts.engineThreads);
    if (auto envProfile = readEnv("BACNET_PROFILE_PATH")) {
        opts.profilePath = *envProfile;
    }
    if (auto envAutostart = readEnv("BACNET_AUTOSTART")) {
        opts.autostart = parseBool(*envAutostart);
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help") {
            opts.showHelp = true;
            break;
        } else if (arg == "--port" && i + 1 < argc) {
            if (auto parsed = parsePort(argv[i + 1])) {
                opts.port = *parsed;
            }
            ++i;
        } else if (arg == "--threads" && i + 1 < argc) {
            if (auto parsed = parsePort(argv[i + 1])) {
                opts.threads = *parsed;
            }
            ++i;
        } else if (arg == "--engine-threads" && i + 1 < argc) {
            if (auto parsed = parseUint(argv[i + 1])) {
                opts.engineThreads = *parsed;
            }
            ++i;
        } else if (arg == "--bacnet-port" && i + 1 < argc) {
            if (auto parsed = parsePort(argv[i + 1])) {
                opts.bacnetPort = *parsed;
            }
            ++i;
        } else if (arg == "--bind" && i + 1 < argc) {
            opts.bindAddress = argv[i + 1];
            ++i;
        } else if (arg == "--iface" && i + 1 < argc) {
            opts.iface = argv[i + 1];
            ++i;
        } else if (arg == "--resolver-target" && i + 1 < argc) {
            opts.resolverTarget = argv[i + 1];
            ++i;
        } else if (arg == "--apdu-timeout-ms" && i + 1 < argc) {
            if (auto parsed = parseUint(argv[i + 1])) {
                opts.apduTimeoutMs = *parsed;
            }
            ++i;
        } else if (arg == "--apdu-retries" && i + 1 < argc) {
            if (auto parsed = parseUint(argv[i + 1])) {
                opts.apduRetries = *parsed;
            }
            ++i;
        } else if (arg == "--scan-window-ms" && i + 1 < argc) {
            if (auto parsed = parseUint(argv[i + 1])) {
                opts.scanWindowMs = *parsed;
            }
            ++i;
        } else if (arg == "--profile" && i + 1 < argc) {
            opts.profilePath = argv[i + 1];
            ++i;
        } else if (arg == "--autostart") {
            opts.autostart = true;
        } else {
            std::cerr << "Ignoring unknown option " << arg << std::endl;
        }
    }

    return opts;
}

bacproxy::ProxyConfig toProxyConfig(const CliOptions &opts) {
    bacproxy::ProxyConfig config;
    config.port = opts.bacnetPort;
    config.bindAddress = opts.bindAddress;
    config.interfaceName = opts.iface;
    config.resolverTarget = opts.resolverTarget;
    config.apduTimeout = std::chrono::milliseconds(opts.apduTimeoutMs);
    config.apduRetries = opts.apduRetries;
    config.scanWindow = std::chrono::milliseconds(opts.scanWindowMs);
    return config;
}

} // namespace

int main(int argc, char **argv) {
    using namespace bacproxy;

    const auto opts = parseArgs(argc, argv);
    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    if (!portAvailable(opts.port)) {
        std::cerr << "Port " << opts.port
                  << " is already in use. Choose a different port with --port or by setting PORT/DROGON_PORT."
                  << std::endl;
        return 1;
    }

    if (!opts.profilePath.empty() && !PropertyProfile::instance().loadFromXml(opts.profilePath)) {
        std::cerr << "Failed to load property profile " << opts.profilePath << "; using built-in defaults"
                  << std::endl;
    }

    BacnetProxy::instance().configure(toProxyConfig(opts));
    setEngineThreads(opts.engineThreads);

    DiscoveryHub discoveryHub;
    discoveryHub.initAndStart(Json::Value());

    if (opts.autostart) {
        auto started = BacnetProxy::instance().start();
        if (!started) {
            std::cerr << "Failed to start BACnet endpoint: " << started.error().describe() << std::endl;
            discoveryHub.shutdown();
            return 1;
        }
    }

    auto &app = drogon::app();
    app.addListener("0.0.0.0", opts.port);
    auto threads = static_cast<std::size_t>(opts.threads);
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    app.setThreadNum(threads);
    std::cout << "[HTTP] Listening on port " << opts.port << std::endl;

    app.run();
    discoveryHub.shutdown();
    return 0;
}
