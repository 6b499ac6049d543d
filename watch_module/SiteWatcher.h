#pragma once

#include <atomic>
#include <memory>

#include "Event.h"
#include "EventQueueClient.h"
#include "Notifier.h"
#include "Site.h"
#include "Transport.h"

// Один сайт: регистрация очереди и бесконечный цикл long-poll.
// run() возвращается нормально только после stop(); фатальные ошибки
// (TransportError, ApiError, NotifyError) пробрасываются наружу.
class SiteWatcher {
public:
    SiteWatcher(Site site,
                std::unique_ptr<Transport> transport,
                ConsoleOutput& console,
                Notifier& notifier);

    void run();
    void stop(); // из любого потока

    bool stopRequested() const { return stopping; }

    // Счётчики для отчёта
    long long messagesSeen() const { return messageCount; }
    long long otherEventsSeen() const { return otherCount; }
    long long lastEventId() const { return cursor; }

private:
    void dispatch(const Event& event);
    void handleMessage(const MessageEvent& ev);

    std::shared_ptr<const Site> site;
    std::unique_ptr<Transport> transport;
    ConsoleOutput& console;
    Notifier& notifier;

    std::atomic<bool> stopping{false};
    std::atomic<long long> messageCount{0};
    std::atomic<long long> otherCount{0};
    long long heartbeatCount = 0;
    std::atomic<long long> cursor{0};
};
