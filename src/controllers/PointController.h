#pragma once

#include <drogon/HttpController.h>

namespace bacproxy {

class PointController : public drogon::HttpController<PointController> {
  public:
    METHOD_LIST_BEGIN
    ADD_METHOD_TO(PointController::readProperty, "/bacnet/read_property", drogon::Get);
    ADD_METHOD_TO(PointController::writeProperty, "/bacnet/write_property", drogon::Post);
    ADD_METHOD_TO(PointController::readDeviceAll, "/bacnet/read_device_all", drogon::Get);
    METHOD_LIST_END

    void readProperty(const drogon::HttpRequestPtr &req,
                      std::function<void(const drogon::HttpResponsePtr &)> &&callback);
    void writeProperty(const drogon::HttpRequestPtr &req,
                       std::function<void(const drogon::HttpResponsePtr &)> &&callback);
    void readDeviceAll(const drogon::HttpRequestPtr &req,
                       std::function<void(const drogon::HttpResponsePtr &)> &&callback);
};

} // namespace bacproxy
