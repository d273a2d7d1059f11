#pragma once
#include "services/ShortenService.h"
#include <json/json.h>
#include <chrono>
#include <cstdint>
#include <string>

enum class StorageBackend {
    Postgres,
    Memory
};

struct RedisSettings {
    std::string host;
    uint16_t port{6379};
    std::string password;
    unsigned int db{0};
    std::chrono::seconds ttl{std::chrono::seconds{86400}};
    std::chrono::milliseconds timeout{std::chrono::milliseconds{1000}};

    bool enabled() const { return !host.empty(); }
};

struct AppSettings {
    std::string baseUrl;
    StorageBackend backend{StorageBackend::Postgres};
    std::string dbUrl;
    size_t dbPoolSize{4};
    std::chrono::milliseconds dbTimeout{std::chrono::milliseconds{5000}};
    RedisSettings redis;
    int maxAttempts{ShortenService::kDefaultMaxAttempts};
    UrlPolicy urlPolicy;
};

// Reads the service section of drogon's custom_config, falling back to
// environment variables. Throws std::runtime_error on invalid values.
AppSettings loadSettings(const Json::Value& config);
