#include "api_json.h"
#include "bacnet_proxy.h"

#include <drogon/drogon.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

// Starts drogon on an ephemeral loopback port, serves the proxy status body
// and fetches it back over HTTP.
int main()
{
    std::atomic<bool> started{false};
    std::atomic<std::uint16_t> port{0};
    bacproxy::BacnetProxy proxy;
    int rc = 0;

    try
    {
        auto &app = drogon::app();
        app.setLogLevel(trantor::Logger::kWarn);
        app.setThreadNum(1);
        app.addListener("127.0.0.1", 0);
        app.registerHandler("/proxy/status",
                            [&proxy](const drogon::HttpRequestPtr &,
                                     std::function<void(const drogon::HttpResponsePtr &)> &&callback) {
                                callback(drogon::HttpResponse::newHttpJsonResponse(
                                    bacproxy::api::statusToJson(proxy.status())));
                            },
                            {drogon::Get});
        app.registerBeginningAdvice([&app, &started, &port]() {
            const auto listeners = app.getListeners();
            if (!listeners.empty())
            {
                port = listeners.front().toPort();
            }
            started = true;
        });

        std::thread runner([&app]() { app.run(); });
        for (int i = 0; i < 50 && !started.load(); ++i)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }

        if (started.load() && port.load() != 0)
        {
            auto client = drogon::HttpClient::newHttpClient("http://127.0.0.1:" + std::to_string(port.load()));
            auto request = drogon::HttpRequest::newHttpRequest();
            request->setPath("/proxy/status");
            const auto [result, response] = client->sendRequest(request, 5.0);
            if (result != drogon::ReqResult::Ok || !response || !response->getJsonObject())
            {
                std::cerr << "GET /proxy/status failed" << std::endl;
                rc = 1;
            }
            else if ((*response->getJsonObject())["running"].asBool())
            {
                std::cerr << "Unstarted proxy reported as running" << std::endl;
                rc = 1;
            }
        }

        app.quit();
        runner.join();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Drogon library detected but startup failed: " << ex.what() << std::endl;
        return 1;
    }

    if (!started.load())
    {
        std::cerr << "Drogon library detected but startup advice never fired." << std::endl;
        return 1;
    }
    if (port.load() == 0)
    {
        std::cerr << "Drogon started without a listener." << std::endl;
        return 1;
    }
    if (rc == 0)
    {
        std::cout << "Drogon serves the bacproxy status API." << std::endl;
    }
    return rc;
}
