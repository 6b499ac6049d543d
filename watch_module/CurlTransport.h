#pragma once

#include <atomic>
#include <string>

#include "Site.h"
#include "Transport.h"

struct CurlOptions {
    std::string userAgent = "chatwatch/1.0";
    long connectTimeoutSec = 10;
    // long-poll держит соединение; общий таймаут должен быть больше серверного
    long totalTimeoutSec = 90;
};

class CurlTransport : public Transport {
public:
    CurlTransport(const Site& site, CurlOptions options);

    HttpResponse send(const HttpRequest& req) override;
    void cancel() override;

    // curl_global_init один раз на процесс
    static void globalInit();
    // пара к globalInit, после остановки всех транспортов
    static void globalCleanup();

    std::string buildUrl(const HttpRequest& req) const;

    bool isCancelled() const { return cancelled; }

private:
    std::string apiBase;
    std::string user;
    std::string token;
    CurlOptions options;

    std::atomic<bool> cancelled{false};
};
