#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Site.h"
#include "SiteWatcher.h"

struct SiteOutcome {
    std::string site;
    bool failed = false;
    std::string errorKind; // TransportError | ApiError | NotifyError | ...
    std::string message;
    int restarts = 0;
};

std::string describeOutcome(const SiteOutcome& o);

// Коды выхода процесса
constexpr int kExitOk = 0;
constexpr int kExitSiteFailed = 1; // хотя бы один сайт упал фатально
constexpr int kExitConfig = 2;     // конфиг или старт

int exitCodeFor(const std::vector<SiteOutcome>& outcomes);

struct SupervisorOptions {
    int maxRestarts = 0;
    // первая фатальная ошибка гасит все сайты
    bool exitOnFailure = false;
};

// Один поток на сайт. Итог каждого сайта отдаётся в onOutcome сразу,
// как только он известен, а не после общего join.
class Supervisor {
public:
    // Новый вотчер (со своим транспортом) на каждую попытку
    using WatcherFactory = std::function<std::unique_ptr<SiteWatcher>(const Site&)>;
    using OutcomeHandler = std::function<void(const SiteOutcome&)>;

    Supervisor(std::vector<Site> sites, WatcherFactory factory, SupervisorOptions options = {});
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    void start(OutcomeHandler onOutcome = nullptr);

    // Остановить один сайт, остальные не трогаем. false если такого сайта нет.
    bool stopSite(const std::string& name);
    void stop();

    // Все сайты завершились
    bool finished() const;

    // Join всех потоков; итоги в порядке конфига
    std::vector<SiteOutcome> wait();

private:
    struct Slot {
        Site site;
        std::thread thread;
        std::mutex m;
        std::unique_ptr<SiteWatcher> current;
        std::atomic<bool> stopRequested{false};
        std::atomic<bool> done{false};
        SiteOutcome outcome;
    };

    void runSite(Slot& slot);
    void report(Slot& slot);

    std::vector<std::unique_ptr<Slot>> slots;
    WatcherFactory factory;
    SupervisorOptions options;
    OutcomeHandler onOutcome;
    std::mutex reportMutex;
    bool started = false;
};
