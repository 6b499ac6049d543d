#pragma once

#include <string>
#include <vector>

#include "Site.h"

struct Config {
    std::vector<Site> sites;
    std::string userAgent = "chatwatch/1.0";
    int maxRestarts = 0;
    bool exitOnFailure = false;
    long pollTimeoutSec = 90;
    bool notifications = true;
    bool verbose = false;
};

// Путь: argv[1] -> CHATWATCH_CONFIG -> config.json
std::string resolveConfigPath(int argc, char** argv);

// Бросает ConfigError
Config loadConfig(const std::string& path);
Config parseConfig(const std::string& text, const std::string& origin = "<config>");

std::string defaultApiBase(const std::string& siteName);
