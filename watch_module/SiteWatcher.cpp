#include "SiteWatcher.h"

#include <iomanip>
#include <sstream>
#include <type_traits>

#include "Errors.h"
#include "EventClassifier.h"
#include "Log.h"

SiteWatcher::SiteWatcher(Site s,
                         std::unique_ptr<Transport> t,
                         ConsoleOutput& c,
                         Notifier& n)
    : site(std::make_shared<const Site>(std::move(s))),
      transport(std::move(t)),
      console(c),
      notifier(n) {}

void SiteWatcher::stop() {
    stopping = true;
    transport->cancel();
}

void SiteWatcher::run() {
    const std::string tag = "site:" + site->name;
    logInfo(tag, "watching " + site->name);

    EventQueueClient client(site, *transport);

    try {
        EventQueue queue = client.registerQueue();
        cursor = queue.last_event_id;
        logInfo(tag, "queue for " + site->name + ": " + queue.queue_id);

        while (!stopping) {
            auto events = client.longPoll(queue);
            cursor = queue.last_event_id;

            // батч разбираем целиком, даже если stop() пришёл посередине
            for (const auto& e : events) {
                dispatch(e);
            }
        }
    } catch (const TransportError&) {
        // отменённый запрос после stop() - это не ошибка
        if (stopping) return;
        throw;
    }
}

void SiteWatcher::dispatch(const Event& event) {
    std::visit([this](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, Heartbeat>) {
            // чтобы в подробном режиме было видно, что long-poll жив
            if (++heartbeatCount % 20 == 0) {
                logDebug("site:" + site->name, "still watching (" + std::to_string(heartbeatCount) + " heartbeats)");
            }
        } else if constexpr (std::is_same_v<T, MessageEvent>) {
            handleMessage(payload);
        } else {
            static_assert(std::is_same_v<T, OtherEvent>, "unhandled event payload");
            ++otherCount;
            logInfo("site:" + site->name, "unknown event type '" + payload.type + "'");
        }
    }, event.payload);
}

void SiteWatcher::handleMessage(const MessageEvent& ev) {
    ++messageCount;
    const bool important = isImportant(ev.flags);

    std::ostringstream line;
    line << (important ? "!" : " ") << " "
         << std::left << std::setw(20) << site->name << " "
         << ev.message.display();
    console.printLine(line.str());

    if (important) {
        notifier.notify(site->name + " " + ev.message.header(), ev.message.content);
    }
}
