#include "EventQueueClient.h"

#include <algorithm>

#include "ApiResult.h"
#include "Errors.h"
#include "Log.h"

EventQueueClient::EventQueueClient(std::shared_ptr<const Site> s, Transport& t)
    : site(std::move(s)), transport(t) {}

EventQueue EventQueueClient::registerQueue() {
    HttpRequest req;
    req.method = "POST";
    req.path = "register";
    req.query = {
        {"event_types", "[\"message\"]"},
        {"all_public_streams", "false"},
    };

    auto resp = parseApiResult<RegisterResponse>(transport.send(req));
    RegisterResponse reg = std::move(resp).intoValue();

    EventQueue queue;
    queue.site = site;
    queue.queue_id = std::move(reg.queue_id);
    queue.last_event_id = reg.last_event_id;
    return queue;
}

std::vector<Event> EventQueueClient::longPoll(EventQueue& queue) {
    HttpRequest req;
    req.method = "GET";
    req.path = "events";
    req.query = {
        {"queue_id", queue.queue_id},
        {"last_event_id", std::to_string(queue.last_event_id)},
        {"dont_block", "false"},
    };

    auto resp = parseApiResult<PollResponse>(transport.send(req));

    if (!resp.ok()) {
        if (resp.errorCode() == kBadEventQueueId) {
            // очередь истекла на сервере: новая регистрация, курсор от сервера
            const std::string old_id = queue.queue_id;
            queue = registerQueue();
            ++reregisterCount;
            logInfo("site:" + site->name,
                    "queue " + old_id + " expired, re-registered as " + queue.queue_id);
            return {};
        }
        throw ApiError(resp.errorPayload());
    }

    std::vector<Event> events = std::move(resp).intoValue().events;
    if (events.empty()) {
        logDebug("site:" + site->name, "empty poll batch, cursor stays at " + std::to_string(queue.last_event_id));
        return events;
    }

    long long max_id = queue.last_event_id;
    for (const auto& e : events) {
        max_id = std::max(max_id, e.id);
    }
    logDebug("site:" + site->name, std::to_string(events.size()) + " event(s), cursor " +
                                       std::to_string(queue.last_event_id) + " -> " + std::to_string(max_id));
    queue.last_event_id = max_id;
    return events;
}
