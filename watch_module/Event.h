#pragma once

#include <chrono>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

enum class MessageFlag {
    Read,
    Mentioned,
    HasAlertWord,
    Other // всё, что сервер ещё может прислать
};

MessageFlag parseMessageFlag(const std::string& s);

using MessageFlags = std::set<MessageFlag>;

struct User {
    std::string full_name;
};

struct StreamRecipient {
    std::string name;
};

using Recipients = std::variant<StreamRecipient, std::vector<User>>;

struct Message {
    std::string content;
    Recipients recipients;
    std::string sender_full_name;
    std::chrono::system_clock::time_point timestamp;
    std::string kind; // "stream" | "private"

    // "[12:34:56] @sender -> #stream"
    std::string header() const;
    // "<header>: <content>"
    std::string display() const;
};

// "#general" | "@A,@B" | "<no users>"
std::string renderRecipients(const Recipients& r);

// HH:MM:SS в локальной зоне
std::string formatLocalTime(std::chrono::system_clock::time_point tp);

struct Heartbeat {};

struct MessageEvent {
    MessageFlags flags;
    Message message;
};

// Неизвестный тип события: принимаем, но не обрабатываем
struct OtherEvent {
    std::string type;
};

using EventPayload = std::variant<Heartbeat, MessageEvent, OtherEvent>;

struct Event {
    long long id = 0;
    EventPayload payload;
};

// Ответ на POST register
struct RegisterResponse {
    std::string queue_id;
    long long last_event_id = 0;
};

// Ответ на GET events
struct PollResponse {
    std::vector<Event> events;
};

// Декодирование; на кривом JSON бросают nlohmann::json::exception
void from_json(const nlohmann::json& j, User& u);
void from_json(const nlohmann::json& j, Message& m);
void from_json(const nlohmann::json& j, Event& e);
void from_json(const nlohmann::json& j, RegisterResponse& r);
void from_json(const nlohmann::json& j, PollResponse& r);
