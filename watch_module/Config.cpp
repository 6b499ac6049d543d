#include "Config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "Errors.h"

using json = nlohmann::json;

static std::string getenv_or(const char* key, const std::string& def) {
    if (const char* v = std::getenv(key)) return std::string(v);
    return def;
}

static bool getenv_bool(const char* key, bool def = false) {
    if (const char* v = std::getenv(key)) {
        std::string s(v);
        return (s == "1" || s == "true" || s == "yes");
    }
    return def;
}

static std::string with_trailing_slash(std::string url) {
    if (url.empty() || url.back() != '/') url += '/';
    return url;
}

std::string defaultApiBase(const std::string& siteName) {
    return "https://" + siteName + ".zulipchat.com/api/v1/";
}

std::string resolveConfigPath(int argc, char** argv) {
    if (argc > 1 && argv[1] && argv[1][0] != '\0') return argv[1];
    return getenv_or("CHATWATCH_CONFIG", "config.json");
}

static std::string required_string(const json& site, const char* key, const std::string& origin, size_t idx) {
    auto it = site.find(key);
    if (it == site.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ConfigError(origin + ": sites[" + std::to_string(idx) + "]." + key + " must be a non-empty string");
    }
    return it->get<std::string>();
}

Config parseConfig(const std::string& text, const std::string& origin) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(origin + ": invalid JSON: " + e.what());
    }

    if (!j.is_object()) throw ConfigError(origin + ": top level must be an object");
    if (!j.contains("sites") || !j["sites"].is_array() || j["sites"].empty()) {
        throw ConfigError(origin + ": \"sites\" must be a non-empty array");
    }

    Config cfg;
    try {
        cfg.userAgent = j.value("user_agent", cfg.userAgent);
        cfg.maxRestarts = j.value("max_restarts", cfg.maxRestarts);
        cfg.exitOnFailure = j.value("exit_on_failure", cfg.exitOnFailure);
        cfg.pollTimeoutSec = j.value("poll_timeout_sec", cfg.pollTimeoutSec);
        cfg.notifications = j.value("notifications", cfg.notifications);
        cfg.verbose = j.value("verbose", cfg.verbose);
    } catch (const json::type_error& e) {
        throw ConfigError(origin + ": " + e.what());
    }
    cfg.verbose = cfg.verbose || getenv_bool("CHATWATCH_VERBOSE");

    if (cfg.maxRestarts < 0) throw ConfigError(origin + ": max_restarts must be >= 0");
    if (cfg.pollTimeoutSec <= 0) throw ConfigError(origin + ": poll_timeout_sec must be > 0");

    // общий base для всех сайтов без явного api_base (удобно для mock-сервера)
    const std::string envBase = getenv_or("CHATWATCH_API_BASE", "");

    size_t idx = 0;
    for (const auto& s : j["sites"]) {
        if (!s.is_object()) {
            throw ConfigError(origin + ": sites[" + std::to_string(idx) + "] must be an object");
        }
        Site site;
        site.name = required_string(s, "name", origin, idx);
        site.user = required_string(s, "user", origin, idx);
        site.token = required_string(s, "token", origin, idx);

        if (s.contains("api_base") && s["api_base"].is_string()) {
            site.apiBase = with_trailing_slash(s["api_base"].get<std::string>());
        } else if (!envBase.empty()) {
            site.apiBase = with_trailing_slash(envBase);
        } else {
            site.apiBase = defaultApiBase(site.name);
        }

        for (const auto& other : cfg.sites) {
            if (other.name == site.name) {
                throw ConfigError(origin + ": duplicate site name '" + site.name + "'");
            }
        }
        cfg.sites.push_back(std::move(site));
        ++idx;
    }
    return cfg;
}

Config loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file: " + path);

    std::ostringstream oss;
    oss << in.rdbuf();
    return parseConfig(oss.str(), path);
}
