#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

#include "Config.h"
#include "CurlTransport.h"
#include "Errors.h"
#include "Log.h"
#include "Notifier.h"
#include "Supervisor.h"

namespace {

std::atomic<bool> g_stop{false};

void onSignal(int) {
    g_stop = true;
}

void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

int main(int argc, char** argv) {
    const std::string path = resolveConfigPath(argc, argv);

    Config cfg;
    try {
        cfg = loadConfig(path);
    } catch (const ConfigError& e) {
        logError("chatwatch", e.what());
        return kExitConfig;
    }
    setVerbose(cfg.verbose);

    CurlTransport::globalInit();
    installSignalHandlers();

    StdoutConsole console;
    std::unique_ptr<Notifier> notifier;
    if (cfg.notifications) {
        notifier = std::make_unique<DesktopNotifier>();
    } else {
        notifier = std::make_unique<LogNotifier>();
    }

    CurlOptions curlOpts;
    curlOpts.userAgent = cfg.userAgent;
    curlOpts.totalTimeoutSec = cfg.pollTimeoutSec;

    auto factory = [&](const Site& site) {
        return std::make_unique<SiteWatcher>(
            site, std::make_unique<CurlTransport>(site, curlOpts), console, *notifier);
    };

    SupervisorOptions opts;
    opts.maxRestarts = cfg.maxRestarts;
    opts.exitOnFailure = cfg.exitOnFailure;

    Supervisor supervisor(cfg.sites, factory, opts);
    logInfo("chatwatch", "config " + path + ": " + std::to_string(cfg.sites.size()) + " site(s)");

    supervisor.start([](const SiteOutcome& o) {
        if (o.failed) {
            logError("supervisor", describeOutcome(o));
        } else {
            logInfo("supervisor", describeOutcome(o));
        }
    });

    while (!g_stop && !supervisor.finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_stop) {
        logInfo("chatwatch", "signal received, stopping...");
        supervisor.stop();
    }

    auto outcomes = supervisor.wait();

    logInfo("chatwatch", "summary:");
    for (const auto& o : outcomes) {
        logInfo("chatwatch", "  " + describeOutcome(o));
    }

    CurlTransport::globalCleanup();
    return exitCodeFor(outcomes);
}
