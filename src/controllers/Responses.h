#pragma once

#include "bacnet_types.h"

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace bacproxy {

// Adds status:"done" to the body.
drogon::HttpResponsePtr doneResponse(Json::Value body = Json::Value(Json::objectValue));

// {status:"error", error, kind} with the HTTP code for the error kind.
drogon::HttpResponsePtr errorResponse(const drogon::HttpRequestPtr &req, const ProxyError &error);

// Query (or form) parameter; missing and empty are the same.
std::optional<std::string> queryParam(const drogon::HttpRequestPtr &req, const std::string &name);

// Decimal parameter within 0..UINT32_MAX. An absent parameter is not an error.
Result<std::optional<std::uint32_t>> uintParam(const drogon::HttpRequestPtr &req, const std::string &name,
                                               ErrorKind kind = ErrorKind::InvalidRequest);

// Scans and transactions block for a discovery window or an APDU timeout, so
// handlers hand them to a worker queue and answer from there.
void setEngineThreads(std::size_t count);
std::size_t engineThreads();
void runEngineTask(std::function<void()> task);

} // namespace bacproxy
