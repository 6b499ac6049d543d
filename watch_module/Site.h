#pragma once

#include <string>

// Один аккаунт на чат-сервере. После загрузки конфига не меняется.
struct Site {
    std::string name;
    std::string user;
    std::string token;
    std::string apiBase; // https://<name>.zulipchat.com/api/v1/
};
