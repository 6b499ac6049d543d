#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

// Сеть упала или ответ не разобрать. Для вотчера фатально.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Сервер вернул {"result":"error", ...}. Полезная нагрузка хранится как есть.
class ApiError : public std::runtime_error {
public:
    explicit ApiError(nlohmann::json payload)
        : std::runtime_error("api call failed: " + payload.dump()),
          fields(std::move(payload)) {}

    const nlohmann::json& payload() const { return fields; }

    std::optional<std::string> code() const {
        auto it = fields.find("code");
        if (it == fields.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }

private:
    nlohmann::json fields;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class NotifyError : public std::runtime_error {
public:
    explicit NotifyError(const std::string& what) : std::runtime_error(what) {}
};

// Имя типа ошибки для отчёта супервизора
inline std::string errorKind(const std::exception& e) {
    if (dynamic_cast<const TransportError*>(&e)) return "TransportError";
    if (dynamic_cast<const ApiError*>(&e)) return "ApiError";
    if (dynamic_cast<const NotifyError*>(&e)) return "NotifyError";
    if (dynamic_cast<const ConfigError*>(&e)) return "ConfigError";
    return "Error";
}
