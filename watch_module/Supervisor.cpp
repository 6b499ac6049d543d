#include "Supervisor.h"

#include "Errors.h"
#include "Log.h"

std::string describeOutcome(const SiteOutcome& o) {
    std::string out = o.site + ": ";
    if (!o.failed) {
        out += "stopped";
    } else {
        out += "failed (" + o.errorKind + "): " + o.message;
    }
    if (o.restarts > 0) out += " [restarts: " + std::to_string(o.restarts) + "]";
    return out;
}

int exitCodeFor(const std::vector<SiteOutcome>& outcomes) {
    for (const auto& o : outcomes) {
        if (o.failed) return kExitSiteFailed;
    }
    return kExitOk;
}

Supervisor::Supervisor(std::vector<Site> sites, WatcherFactory f, SupervisorOptions opts)
    : factory(std::move(f)), options(opts) {
    for (auto& s : sites) {
        auto slot = std::make_unique<Slot>();
        slot->site = std::move(s);
        slot->outcome.site = slot->site.name;
        slots.push_back(std::move(slot));
    }
}

Supervisor::~Supervisor() {
    stop();
    for (auto& slot : slots) {
        if (slot->thread.joinable()) slot->thread.join();
    }
}

void Supervisor::start(OutcomeHandler handler) {
    if (started) return;
    started = true;
    onOutcome = std::move(handler);

    for (auto& slot : slots) {
        Slot* raw = slot.get();
        slot->thread = std::thread([this, raw]() { runSite(*raw); });
    }
}

void Supervisor::runSite(Slot& slot) {
    const std::string tag = "supervisor";

    for (int attempt = 0;; ++attempt) {
        if (slot.stopRequested) break;

        std::unique_ptr<SiteWatcher> watcher;
        try {
            watcher = factory(slot.site);
        } catch (const std::exception& e) {
            slot.outcome.failed = true;
            slot.outcome.errorKind = errorKind(e);
            slot.outcome.message = e.what();
            logError(tag, slot.site.name + ": cannot create watcher: " + e.what());
            break;
        }

        {
            std::lock_guard<std::mutex> lk(slot.m);
            slot.current = std::move(watcher);
            // stop() мог прийти, пока вотчера ещё не было
            if (slot.stopRequested) slot.current->stop();
        }

        try {
            slot.current->run();
            slot.outcome.failed = false;
            slot.outcome.errorKind.clear();
            slot.outcome.message.clear();
            break;
        } catch (const std::exception& e) {
            slot.outcome.failed = true;
            slot.outcome.errorKind = errorKind(e);
            slot.outcome.message = e.what();
            logError(tag, slot.site.name + " failed (" + slot.outcome.errorKind + "): " + e.what());
        }

        if (slot.stopRequested || attempt >= options.maxRestarts) break;

        ++slot.outcome.restarts;
        logInfo(tag, "restarting " + slot.site.name + " (" + std::to_string(slot.outcome.restarts) +
                         "/" + std::to_string(options.maxRestarts) + ")");
    }

    {
        std::lock_guard<std::mutex> lk(slot.m);
        slot.current.reset();
    }
    report(slot);
}

void Supervisor::report(Slot& slot) {
    {
        std::lock_guard<std::mutex> lk(reportMutex);
        slot.done = true;
        if (onOutcome) onOutcome(slot.outcome);
    }

    if (slot.outcome.failed && options.exitOnFailure) {
        logInfo("supervisor", "exit_on_failure: stopping all sites after " + slot.site.name + " failed");
        stop();
    }
}

bool Supervisor::stopSite(const std::string& name) {
    for (auto& slot : slots) {
        if (slot->site.name != name) continue;
        slot->stopRequested = true;
        std::lock_guard<std::mutex> lk(slot->m);
        if (slot->current) slot->current->stop();
        return true;
    }
    return false;
}

void Supervisor::stop() {
    for (auto& slot : slots) {
        slot->stopRequested = true;
        std::lock_guard<std::mutex> lk(slot->m);
        if (slot->current) slot->current->stop();
    }
}

bool Supervisor::finished() const {
    for (const auto& slot : slots) {
        if (!slot->done) return false;
    }
    return true;
}

std::vector<SiteOutcome> Supervisor::wait() {
    for (auto& slot : slots) {
        if (slot->thread.joinable()) slot->thread.join();
    }

    std::vector<SiteOutcome> out;
    for (auto& slot : slots) out.push_back(slot->outcome);
    return out;
}
