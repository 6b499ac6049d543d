#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../CurlTransport.h"
#include "../Errors.h"
#include "../EventQueueClient.h"

using json = nlohmann::json;
using namespace std::chrono_literals;

// Локальный сервер на 127.0.0.1 со случайным портом
struct LocalServer {
    httplib::Server app;
    std::thread thread;
    int port = 0;

    // пишут потоки httplib, читает тест
    struct Seen {
        std::string auth;
        std::string userAgent;
        std::string queueId;
        std::string eventTypes;
    };
    std::mutex m;
    Seen last;
    std::atomic<bool> releaseHold{false};

    LocalServer() {
        app.Post("/api/v1/register", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lk(m);
                last.auth = req.get_header_value("Authorization");
                last.userAgent = req.get_header_value("User-Agent");
                last.eventTypes = req.get_param_value("event_types");
            }
            res.set_content(json{{"result", "success"}, {"queue_id", "1517975029:0"}, {"last_event_id", -1}}.dump(),
                            "application/json");
        });

        app.Get("/api/v1/events", [this](const httplib::Request& req, httplib::Response& res) {
            const std::string queueId = req.get_param_value("queue_id");
            {
                std::lock_guard<std::mutex> lk(m);
                last.queueId = queueId;
            }
            if (queueId == "expired") {
                res.status = 400;
                res.set_content(json{{"result", "error"}, {"code", "BAD_EVENT_QUEUE_ID"}, {"msg", "Bad event queue id"}}.dump(),
                                "application/json");
                return;
            }
            if (queueId == "hold") {
                // висим, пока клиент не отменит запрос
                for (int i = 0; i < 500 && !releaseHold; ++i) std::this_thread::sleep_for(10ms);
            }
            res.set_content(json{{"result", "success"}, {"events", json::array({{{"type", "heartbeat"}, {"id", 0}}})}}.dump(),
                            "application/json");
        });

        app.Get("/api/v1/html", [](const httplib::Request&, httplib::Response& res) {
            res.status = 502;
            res.set_content("<html>Bad Gateway</html>", "text/html");
        });

        port = app.bind_to_any_port("127.0.0.1");
        thread = std::thread([this] { app.listen_after_bind(); });
        app.wait_until_ready();
    }

    ~LocalServer() {
        releaseHold = true;
        app.stop();
        if (thread.joinable()) thread.join();
    }

    Seen seen() {
        std::lock_guard<std::mutex> lk(m);
        return last;
    }

    Site site() const {
        return Site{"local", "bot@example.com", "s3cret", "http://127.0.0.1:" + std::to_string(port) + "/api/v1/"};
    }
};

static bool sendFails(CurlTransport& transport, const HttpRequest& req) {
    try {
        transport.send(req);
    } catch (const TransportError&) {
        return true;
    }
    return false;
}

static void testBuildUrl() {
    Site site{"x", "u", "t", "https://x.zulipchat.com/api/v1/"};
    CurlTransport transport(site, CurlOptions{});

    HttpRequest req;
    req.method = "GET";
    req.path = "events";
    req.query = {{"queue_id", "1517975029:0"}, {"last_event_id", "-1"}};
    assert(transport.buildUrl(req) == std::string("https://x.zulipchat.com/api/v1/events?queue_id=1517975029%3A0&last_event_id=-1"));

    req.query = {{"event_types", "[\"message\"]"}};
    assert(transport.buildUrl(req) == std::string("https://x.zulipchat.com/api/v1/events?event_types=%5B%22message%22%5D"));
}

static void testRegisterAndPoll(LocalServer& server) {
    auto site = std::make_shared<const Site>(server.site());
    CurlOptions opts;
    opts.userAgent = "chatwatch-test";
    CurlTransport transport(*site, opts);
    EventQueueClient client(site, transport);

    EventQueue q = client.registerQueue();
    assert(q.queue_id == std::string("1517975029:0"));
    assert(q.last_event_id == -1);

    LocalServer::Seen seen = server.seen();
    // "bot@example.com:s3cret" в base64
    assert(seen.auth == std::string("Basic Ym90QGV4YW1wbGUuY29tOnMzY3JldA=="));
    assert(seen.userAgent == std::string("chatwatch-test"));
    assert(seen.eventTypes == std::string("[\"message\"]"));

    auto events = client.longPoll(q);
    assert(events.size() == 1u);
    assert(q.last_event_id == 0);
    assert(server.seen().queueId == std::string("1517975029:0"));
}

static void testErrorBodies(LocalServer& server) {
    Site site = server.site();
    CurlTransport transport(site, CurlOptions{});

    HttpRequest req;
    req.method = "GET";
    req.path = "events";
    req.query = {{"queue_id", "expired"}, {"last_event_id", "3"}};
    HttpResponse resp = transport.send(req);
    assert(resp.status == 400);
    assert(resp.body.find("BAD_EVENT_QUEUE_ID") != std::string::npos);

    req.path = "html";
    req.query.clear();
    resp = transport.send(req);
    assert(resp.status == 502);
}

static void testConnectionRefused() {
    // порт 1 на loopback никто не слушает
    Site site{"dead", "u", "t", "http://127.0.0.1:1/api/v1/"};
    CurlTransport transport(site, CurlOptions{});
    HttpRequest req{"POST", "register", {}};
    assert(sendFails(transport, req));
}

static void testCancel(LocalServer& server) {
    Site site = server.site();
    CurlTransport transport(site, CurlOptions{});

    HttpRequest req;
    req.method = "GET";
    req.path = "events";
    req.query = {{"queue_id", "hold"}, {"last_event_id", "0"}};

    std::thread canceller([&] {
        std::this_thread::sleep_for(200ms);
        transport.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    assert(sendFails(transport, req));
    canceller.join();
    assert(std::chrono::steady_clock::now() - start < 4s);

    // после cancel() новые запросы сразу отклоняются
    assert(sendFails(transport, req));
    server.releaseHold = true;
}

int main() {
    CurlTransport::globalInit();

    testBuildUrl();
    testConnectionRefused();
    {
        LocalServer server;
        assert(server.port > 0);
        testRegisterAndPoll(server);
        testErrorBodies(server);
        testCancel(server);
    }

    CurlTransport::globalCleanup();

    std::cout << "CurlTransport test PASSED\n";
    return 0;
}
