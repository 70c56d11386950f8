#pragma once

#include <drogon/HttpController.h>

#include <string>

namespace bacproxy {

class DiscoveryController : public drogon::HttpController<DiscoveryController> {
  public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(DiscoveryController::scan, "/bacnet/scan", drogon::Get, drogon::Post);
    ADD_METHOD_TO(DiscoveryController::legacyScan, "/{1}/scan/start", drogon::Get, drogon::Post);
    ADD_METHOD_TO(DiscoveryController::whoIs, "/bacnet/whois", drogon::Get, drogon::Post);
    ADD_METHOD_TO(DiscoveryController::devices, "/bacnet/devices", drogon::Get);
    ADD_METHOD_TO(DiscoveryController::devices, "/devices", drogon::Get);
    METHOD_LIST_END

    void scan(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);

    // Older clients call /bacnet/scan/start?ip_address=...
    void legacyScan(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback,
                    const std::string &tool);

    void whoIs(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);
    void devices(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);
};

} // namespace bacproxy
