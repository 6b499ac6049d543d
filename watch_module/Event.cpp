#include "Event.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

MessageFlag parseMessageFlag(const std::string& s) {
    if (s == "read") return MessageFlag::Read;
    if (s == "mentioned") return MessageFlag::Mentioned;
    if (s == "has_alert_word") return MessageFlag::HasAlertWord;
    return MessageFlag::Other;
}

std::string formatLocalTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

std::string renderRecipients(const Recipients& r) {
    if (auto* stream = std::get_if<StreamRecipient>(&r)) {
        return "#" + stream->name;
    }

    const auto& users = std::get<std::vector<User>>(r);
    if (users.empty()) return "<no users>";

    std::string out;
    for (size_t i = 0; i < users.size(); ++i) {
        if (i > 0) out += ",";
        out += "@" + users[i].full_name;
    }
    return out;
}

std::string Message::header() const {
    return "[" + formatLocalTime(timestamp) + "] @" + sender_full_name + " -> " + renderRecipients(recipients);
}

std::string Message::display() const {
    return header() + ": " + content;
}

void from_json(const json& j, User& u) {
    j.at("full_name").get_to(u.full_name);
}

void from_json(const json& j, Message& m) {
    j.at("content").get_to(m.content);
    j.at("sender_full_name").get_to(m.sender_full_name);
    m.kind = j.value("type", "");

    // display_recipient: строка (stream) или список пользователей (private)
    const auto& dr = j.at("display_recipient");
    if (dr.is_string()) {
        m.recipients = StreamRecipient{dr.get<std::string>()};
    } else {
        m.recipients = dr.get<std::vector<User>>();
    }

    // в наносекундах system_clock помещается примерно +-292 года от эпохи
    using std::chrono::seconds;
    using std::chrono::system_clock;
    constexpr long long maxSec = std::chrono::duration_cast<seconds>(system_clock::duration::max()).count();
    constexpr long long minSec = std::chrono::duration_cast<seconds>(system_clock::duration::min()).count();

    long long ts = j.at("timestamp").get<long long>();
    if (ts > maxSec || ts < minSec) {
        throw std::out_of_range("message timestamp out of range: " + std::to_string(ts));
    }
    m.timestamp = system_clock::time_point(seconds(ts));
}

void from_json(const json& j, Event& e) {
    j.at("id").get_to(e.id);

    const std::string type = j.at("type").get<std::string>();
    if (type == "heartbeat") {
        e.payload = Heartbeat{};
    } else if (type == "message") {
        MessageEvent me;
        for (const auto& f : j.value("flags", json::array())) {
            me.flags.insert(parseMessageFlag(f.get<std::string>()));
        }
        j.at("message").get_to(me.message);
        e.payload = std::move(me);
    } else {
        e.payload = OtherEvent{type};
    }
}

void from_json(const json& j, RegisterResponse& r) {
    j.at("queue_id").get_to(r.queue_id);
    j.at("last_event_id").get_to(r.last_event_id);
}

void from_json(const json& j, PollResponse& r) {
    j.at("events").get_to(r.events);
}
