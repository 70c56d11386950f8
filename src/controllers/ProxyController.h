#pragma once

#include <drogon/HttpController.h>

namespace bacproxy {

class ProxyController : public drogon::HttpController<ProxyController> {
  public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(ProxyController::start, "/proxy/start", drogon::Get, drogon::Post);
    ADD_METHOD_TO(ProxyController::stop, "/proxy/stop", drogon::Get, drogon::Post);
    ADD_METHOD_TO(ProxyController::status, "/proxy/status", drogon::Get);
    METHOD_LIST_END

    void start(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);
    void stop(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);
    void status(const drogon::HttpRequestPtr &req, std::function<void(const drogon::HttpResponsePtr &)> &&callback);
};

} // namespace bacproxy
