#pragma once

#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
    std::string method; // "GET" | "POST"
    std::string path;   // относительно apiBase сайта, напр. "events"
    std::vector<std::pair<std::string, std::string>> query; // без экранирования
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Аутентифицированный отправитель запросов к одному сайту.
// Один экземпляр на вотчер, между сайтами не делится.
class Transport {
public:
    virtual ~Transport() = default;

    // Бросает TransportError, если ответа нет
    virtual HttpResponse send(const HttpRequest& req) = 0;

    // Прервать текущий (и все последующие) запросы. Можно звать из другого потока.
    virtual void cancel() {}
};
