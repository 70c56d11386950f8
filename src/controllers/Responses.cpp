#include "controllers/Responses.h"

#include "api_json.h"

#include <trantor/utils/ConcurrentTaskQueue.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>

namespace bacproxy {

namespace {

constexpr std::size_t kDefaultEngineThreads = 8;

std::atomic<std::size_t> g_engineThreads{kDefaultEngineThreads};

trantor::ConcurrentTaskQueue &engineQueue() {
    static std::once_flag created;
    static std::unique_ptr<trantor::ConcurrentTaskQueue> queue;
    std::call_once(created, []() {
        const auto count = g_engineThreads.load();
        queue = std::make_unique<trantor::ConcurrentTaskQueue>(count, "bacproxy-engine");
        std::cout << "[HTTP] Engine queue running " << count << " worker thread(s)" << std::endl;
    });
    return *queue;
}

} // namespace

drogon::HttpResponsePtr doneResponse(Json::Value body) {
    body["status"] = "done";
    return drogon::HttpResponse::newHttpJsonResponse(body);
}

drogon::HttpResponsePtr errorResponse(const drogon::HttpRequestPtr &req, const ProxyError &error) {
    const auto code = api::httpStatusFor(error.kind);
    std::cerr << "[HTTP] " << req->methodString() << " " << req->path() << " -> " << code << ": "
              << error.describe() << std::endl;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(api::errorToJson(error));
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(code));
    return resp;
}

std::optional<std::string> queryParam(const drogon::HttpRequestPtr &req, const std::string &name) {
    const auto &value = req->getParameter(name);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

Result<std::optional<std::uint32_t>> uintParam(const drogon::HttpRequestPtr &req, const std::string &name,
                                               ErrorKind kind) {
    const auto text = queryParam(req, name);
    if (!text) {
        return std::optional<std::uint32_t>();
    }
    const auto value = parseUnsigned(*text);
    if (!value) {
        return makeError(kind, name + " must be an unsigned integer, got '" + *text + "'");
    }
    return std::optional<std::uint32_t>(*value);
}

void setEngineThreads(std::size_t count) {
    g_engineThreads = count > 0 ? count : 1;
}

std::size_t engineThreads() {
    return g_engineThreads.load();
}

void runEngineTask(std::function<void()> task) {
    engineQueue().runTaskInQueue(std::move(task));
}

} // namespace bacproxy
