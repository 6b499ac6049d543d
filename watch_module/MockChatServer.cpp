#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Мок чат-сервера для ручной проверки chatwatch:
//   CHATWATCH_API_BASE=http://127.0.0.1:9991/api/v1/ ./chatwatch config.json
//   curl -X POST localhost:9991/mock/send -d '{"content":"hi","stream":"general","flags":["mentioned"]}'
//   curl -X POST localhost:9991/mock/expire

static int getenv_int(const char* key, int def) {
    if (const char* v = std::getenv(key)) {
        try { return std::stoi(v); } catch (const std::exception&) { return def; }
    }
    return def;
}

static std::string random_hex_token(size_t bytes = 8) {
    std::random_device rd;
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(bytes * 2);
    for (size_t i = 0; i < bytes; ++i) {
        unsigned int b = rd() & 0xFF;
        out.push_back(hex[(b >> 4) & 0xF]);
        out.push_back(hex[b & 0xF]);
    }
    return out;
}

static void reply_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

static bool has_basic_auth(const httplib::Request& req) {
    return req.get_header_value("Authorization").rfind("Basic ", 0) == 0;
}

struct MockQueue {
    std::vector<json> events;
    long long next_id = 0;
};

int main() {
    const int port = getenv_int("MOCK_PORT", 9991);
    const int hold_sec = getenv_int("MOCK_HOLD_SEC", 20);

    std::map<std::string, MockQueue> queues;
    std::mutex m;
    std::condition_variable cv;

    httplib::Server app;

    app.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[mock_chat] " << req.method << " " << req.path
                  << " status=" << res.status << std::endl;
    });

    app.Post("/api/v1/register", [&](const httplib::Request& req, httplib::Response& res) {
        if (!has_basic_auth(req)) {
            reply_json(res, 401, json{{"result", "error"}, {"msg", "Unauthorized"}, {"code", "UNAUTHORIZED"}});
            return;
        }

        std::string id = "mock-" + random_hex_token();
        {
            std::lock_guard<std::mutex> lk(m);
            queues[id] = MockQueue{};
        }
        reply_json(res, 200, json{{"result", "success"}, {"queue_id", id}, {"last_event_id", -1}});
    });

    app.Get("/api/v1/events", [&](const httplib::Request& req, httplib::Response& res) {
        if (!has_basic_auth(req)) {
            reply_json(res, 401, json{{"result", "error"}, {"msg", "Unauthorized"}, {"code", "UNAUTHORIZED"}});
            return;
        }

        const std::string qid = req.get_param_value("queue_id");
        long long last = -1;
        try { last = std::stoll(req.get_param_value("last_event_id")); }
        catch (const std::exception&) {
            reply_json(res, 400, json{{"result", "error"}, {"msg", "bad last_event_id"}, {"code", "BAD_REQUEST"}});
            return;
        }

        auto bad_queue = json{{"result", "error"},
                              {"msg", "Bad event queue id: " + qid},
                              {"code", "BAD_EVENT_QUEUE_ID"},
                              {"queue_id", qid}};

        std::unique_lock<std::mutex> lk(m);
        auto pending = [&]() {
            auto it = queues.find(qid);
            if (it == queues.end()) return true;
            for (const auto& e : it->second.events) {
                if (e["id"].get<long long>() > last) return true;
            }
            return false;
        };

        if (!cv.wait_for(lk, std::chrono::seconds(hold_sec), pending)) {
            auto& q = queues[qid];
            q.events.push_back(json{{"type", "heartbeat"}, {"id", q.next_id++}});
        }

        auto it = queues.find(qid);
        if (it == queues.end()) {
            reply_json(res, 400, bad_queue);
            return;
        }

        // подтверждённые события больше не нужны
        auto& evs = it->second.events;
        json out = json::array();
        std::vector<json> keep;
        for (auto& e : evs) {
            if (e["id"].get<long long>() > last) {
                out.push_back(e);
                keep.push_back(e);
            }
        }
        evs = std::move(keep);

        reply_json(res, 200, json{{"result", "success"}, {"events", out}, {"queue_id", qid}});
    });

    // Body: {"content":"...", "sender":"...", "stream":"general"} или "to":["A","B"], "flags":[...]
    app.Post("/mock/send", [&](const httplib::Request& req, httplib::Response& res) {
        json in;
        try { in = json::parse(req.body); }
        catch (const json::exception&) {
            reply_json(res, 400, json{{"error", "bad json"}});
            return;
        }

        json msg = {
            {"content", in.value("content", "")},
            {"sender_full_name", in.value("sender", "Mock User")},
            {"timestamp", static_cast<long long>(std::time(nullptr))},
        };
        if (in.contains("to") && in["to"].is_array()) {
            json users = json::array();
            for (const auto& name : in["to"]) users.push_back({{"full_name", name}});
            msg["display_recipient"] = users;
            msg["type"] = "private";
        } else {
            msg["display_recipient"] = in.value("stream", "general");
            msg["type"] = "stream";
        }
        json flags = in.contains("flags") ? in["flags"] : json::array();

        size_t delivered = 0;
        {
            std::lock_guard<std::mutex> lk(m);
            for (auto& [id, q] : queues) {
                q.events.push_back(json{{"type", "message"}, {"id", q.next_id++}, {"flags", flags}, {"message", msg}});
                ++delivered;
            }
        }
        cv.notify_all();
        reply_json(res, 200, json{{"ok", true}, {"queues", delivered}});
    });

    // Все очереди истекают: следующий poll получит BAD_EVENT_QUEUE_ID
    app.Post("/mock/expire", [&](const httplib::Request&, httplib::Response& res) {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lk(m);
            dropped = queues.size();
            queues.clear();
        }
        cv.notify_all();
        reply_json(res, 200, json{{"ok", true}, {"dropped", dropped}});
    });

    std::cout << "Mock chat server listening on 0.0.0.0:" << port
              << " (hold " << hold_sec << "s)" << std::endl;
    if (!app.listen("0.0.0.0", port)) {
        std::cerr << "[mock_chat ERROR] cannot listen on port " << port << std::endl;
        return 1;
    }
    return 0;
}
