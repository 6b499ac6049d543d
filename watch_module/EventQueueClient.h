#pragma once

#include <memory>
#include <string>
#include <vector>

#include "Event.h"
#include "Site.h"
#include "Transport.h"

// Код ошибки, после которого очередь надо зарегистрировать заново
constexpr const char* kBadEventQueueId = "BAD_EVENT_QUEUE_ID";

struct EventQueue {
    std::shared_ptr<const Site> site;
    std::string queue_id;
    long long last_event_id = 0;
};

// Регистрация очереди и long-poll одного сайта.
// Ошибки: ApiError (сервер ответил error), TransportError (сеть/разбор).
class EventQueueClient {
public:
    EventQueueClient(std::shared_ptr<const Site> site, Transport& transport);

    EventQueue registerQueue();

    // Блокируется до прихода событий. Курсор двигается на max(курсор, max id).
    // Пустой батч допустим. На BAD_EVENT_QUEUE_ID очередь тихо перерегистрируется
    // и возвращается пустой батч.
    std::vector<Event> longPoll(EventQueue& queue);

    int reregistrations() const { return reregisterCount; }

private:
    std::shared_ptr<const Site> site;
    Transport& transport;
    int reregisterCount = 0;
};
