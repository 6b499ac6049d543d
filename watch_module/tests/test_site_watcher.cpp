#include <cassert>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <thread>

#include "../Errors.h"
#include "../SiteWatcher.h"
#include "Fakes.h"

using namespace std::chrono_literals;

static Site testSite(const std::string& name = "acme") {
    return Site{name, "bot@example.com", "secret", "http://localhost/api/v1/"};
}

// register -> Q1/5, heartbeat 6, message 7 с упоминанием
static void testEndToEnd() {
    auto script = std::make_shared<FakeScript>();
    script->push(registerOk("Q1", 5));
    script->push(eventsOk(json::array({heartbeatJson(6)})));
    script->push(eventsOk(json::array({streamMessageJson(7, json::array({"mentioned"}), "ping @**bot**", "general", "Alice")})));

    RecordingConsole console;
    RecordingNotifier notifier;
    SiteWatcher watcher(testSite(), std::make_unique<FakeTransport>(script), console, notifier);

    std::thread t([&] { watcher.run(); });

    bool printed = console.waitForLines(1, 5s);
    assert(printed);
    // после сценария вотчер висит в следующем poll
    while (script->sentCount() < 4) std::this_thread::sleep_for(5ms);
    watcher.stop();
    t.join();

    auto lines = console.all();
    assert(lines.size() == 1u);
    assert(lines[0] == std::string("! acme                 [22:13:20] @Alice -> #general: ping @**bot**"));

    auto notes = notifier.all();
    assert(notes.size() == 1u);
    assert(notes[0].summary == std::string("acme [22:13:20] @Alice -> #general"));
    assert(notes[0].body == std::string("ping @**bot**"));

    assert(watcher.lastEventId() == 7);
    assert(watcher.messagesSeen() == 1);

    auto sent = script->sent();
    assert(queryValue(sent[1], "last_event_id") == std::string("5"));
    assert(queryValue(sent[2], "last_event_id") == std::string("6"));
    assert(queryValue(sent[3], "last_event_id") == std::string("7"));
}

static void testUnimportantAndOther() {
    auto script = std::make_shared<FakeScript>();
    script->push(registerOk("Q1", 0));
    script->push(eventsOk(json::array({
        streamMessageJson(1, json::array({"read"}), "just chatting", "random", "Bob"),
        json{{"type", "update_message"}, {"id", 2}},
        streamMessageJson(3, json::array({"has_alert_word"}), "deploy failed", "ops", "CI"),
    })));

    RecordingConsole console;
    RecordingNotifier notifier;
    SiteWatcher watcher(testSite("x"), std::make_unique<FakeTransport>(script), console, notifier);

    std::thread t([&] { watcher.run(); });
    bool printed = console.waitForLines(2, 5s);
    assert(printed);
    while (script->sentCount() < 3) std::this_thread::sleep_for(5ms);
    watcher.stop();
    t.join();

    auto lines = console.all();
    assert(lines.size() == 2u);
    assert(lines[0] == std::string("  x                    [22:13:20] @Bob -> #random: just chatting"));
    assert(lines[1] == std::string("! x                    [22:13:20] @CI -> #ops: deploy failed"));
    auto notes = notifier.all();
    assert(notes.size() == 1u);
    assert(notes[0].body == std::string("deploy failed"));
    assert(watcher.otherEventsSeen() == 1);
    assert(watcher.lastEventId() == 3);
}

static void testReconnectDoesNotStopLoop() {
    auto script = std::make_shared<FakeScript>();
    script->push(registerOk("Q1", 5));
    script->push(apiError("BAD_EVENT_QUEUE_ID"));
    script->push(registerOk("Q2", 100));
    script->push(eventsOk(json::array({streamMessageJson(101, json::array(), "after reconnect")})));

    RecordingConsole console;
    RecordingNotifier notifier;
    SiteWatcher watcher(testSite(), std::make_unique<FakeTransport>(script), console, notifier);

    std::thread t([&] { watcher.run(); });
    bool printed = console.waitForLines(1, 5s);
    assert(printed);
    while (script->sentCount() < 5) std::this_thread::sleep_for(5ms);
    watcher.stop();
    t.join();

    auto sent = script->sent();
    assert(queryValue(sent[3], "queue_id") == std::string("Q2"));
    assert(queryValue(sent[4], "queue_id") == std::string("Q2"));
    assert(queryValue(sent[4], "last_event_id") == std::string("101"));
    assert(notifier.all().empty());
}

static void testFatalErrorsPropagate() {
    {
        auto script = std::make_shared<FakeScript>();
        script->push(registerOk("Q1", 5));
        script->push(apiError("BAD_REQUEST", "nope"));
        RecordingConsole console;
        RecordingNotifier notifier;
        SiteWatcher watcher(testSite(), std::make_unique<FakeTransport>(script), console, notifier);
        bool caught = false;
        try {
            watcher.run();
        } catch (const ApiError&) {
            caught = true;
        }
        assert(caught);
    }
    {
        auto script = std::make_shared<FakeScript>();
        script->failAlways = true;
        RecordingConsole console;
        RecordingNotifier notifier;
        SiteWatcher watcher(testSite(), std::make_unique<FakeTransport>(script), console, notifier);
        bool caught = false;
        try {
            watcher.run();
        } catch (const TransportError&) {
            caught = true;
        }
        assert(caught);
    }
    {
        // уведомление не показалось: это конец вотчера
        auto script = std::make_shared<FakeScript>();
        script->push(registerOk("Q1", 5));
        script->push(eventsOk(json::array({streamMessageJson(6, json::array({"mentioned"}), "hey")})));
        RecordingConsole console;
        RecordingNotifier notifier;
        notifier.failWith = true;
        SiteWatcher watcher(testSite(), std::make_unique<FakeTransport>(script), console, notifier);
        bool caught = false;
        try {
            watcher.run();
        } catch (const NotifyError&) {
            caught = true;
        }
        assert(caught);
        assert(console.all().size() == 1u);
    }
}

static void testStopBeforeRun() {
    auto script = std::make_shared<FakeScript>();
    RecordingConsole console;
    RecordingNotifier notifier;
    SiteWatcher watcher(testSite(), std::make_unique<FakeTransport>(script), console, notifier);
    watcher.stop();
    watcher.run(); // не бросает
    assert(watcher.stopRequested());
    assert(script->sentCount() == 1u);
}

int main() {
    setenv("TZ", "UTC", 1);
    tzset();

    testEndToEnd();
    testUnimportantAndOther();
    testReconnectDoesNotStopLoop();
    testFatalErrorsPropagate();
    testStopBeforeRun();

    std::cout << "SiteWatcher test PASSED\n";
    return 0;
}
