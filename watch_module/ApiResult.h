#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "Errors.h"
#include "Transport.h"

// {"result":"success", ...} -> T, {"result":"error", ...} -> весь объект как есть
template <typename T>
class ApiResult {
public:
    static ApiResult success(T value) { return ApiResult(std::move(value)); }
    static ApiResult error(nlohmann::json payload) { return ApiResult(ErrorPayload{std::move(payload)}); }

    bool ok() const { return std::holds_alternative<T>(data); }

    const T& value() const { return std::get<T>(data); }
    const nlohmann::json& errorPayload() const { return std::get<ErrorPayload>(data).fields; }

    std::optional<std::string> errorCode() const {
        if (ok()) return std::nullopt;
        const auto& fields = errorPayload();
        auto it = fields.find("code");
        if (it == fields.end() || !it->is_string()) return std::nullopt;
        return it->template get<std::string>();
    }

    // Значение или ApiError
    T intoValue() && {
        if (!ok()) throw ApiError(errorPayload());
        return std::move(std::get<T>(data));
    }

private:
    struct ErrorPayload {
        nlohmann::json fields;
    };

    explicit ApiResult(T value) : data(std::move(value)) {}
    explicit ApiResult(ErrorPayload err) : data(std::move(err)) {}

    std::variant<T, ErrorPayload> data;
};

// Разбор тела ответа. Не-JSON или JSON без "result" -> TransportError.
template <typename T>
ApiResult<T> parseApiResult(const HttpResponse& resp) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw TransportError("undecodable response (HTTP " + std::to_string(resp.status) + "): " + e.what());
    }

    if (!j.is_object() || !j.contains("result") || !j["result"].is_string()) {
        throw TransportError("malformed response (HTTP " + std::to_string(resp.status) + "): no \"result\" field");
    }

    const std::string result = j["result"].get<std::string>();
    if (result == "error") {
        return ApiResult<T>::error(std::move(j));
    }
    if (result != "success") {
        throw TransportError("malformed response: unexpected result '" + result + "'");
    }

    try {
        return ApiResult<T>::success(j.get<T>());
    } catch (const nlohmann::json::exception& e) {
        throw TransportError(std::string("undecodable response: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw TransportError(std::string("undecodable response: ") + e.what());
    }
}
