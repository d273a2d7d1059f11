#include "AppSettings.h"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>

namespace {
std::optional<std::string> readString(const Json::Value& node, const char* field) {
    if (node.isMember(field) && node[field].isString()) {
        auto value = node[field].asString();
        if (!value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> readEnv(const char* name) {
    if (const char* value = std::getenv(name)) {
        if (*value) {
            return std::string(value);
        }
    }
    return std::nullopt;
}

long long parseNumber(const std::string& text, const std::string& name) {
    size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw std::runtime_error(name + " must be numeric");
    }
    if (used != text.size()) {
        throw std::runtime_error(name + " must be numeric");
    }
    return parsed;
}

// Accepts either a JSON number or a numeric string.
std::optional<long long> readNumber(const Json::Value& node, const char* field, const std::string& path) {
    if (!node.isMember(field)) {
        return std::nullopt;
    }
    const auto& value = node[field];
    if (value.isIntegral()) {
        return value.asInt64();
    }
    if (value.isString()) {
        return parseNumber(value.asString(), path);
    }
    throw std::runtime_error(path + " must be numeric");
}

// Positive number of seconds, fractional values allowed.
std::optional<std::chrono::milliseconds> readTimeout(const Json::Value& node, const char* field, const std::string& path) {
    if (!node.isMember(field)) {
        return std::nullopt;
    }
    const auto& value = node[field];
    double seconds = 0;
    if (value.isNumeric()) {
        seconds = value.asDouble();
    } else if (value.isString()) {
        size_t used = 0;
        try {
            seconds = std::stod(value.asString(), &used);
        } catch (const std::exception&) {
            throw std::runtime_error(path + " must be numeric");
        }
        if (used != value.asString().size()) {
            throw std::runtime_error(path + " must be numeric");
        }
    } else {
        throw std::runtime_error(path + " must be numeric");
    }
    if (!(seconds >= 0.001 && seconds <= 3600)) {
        throw std::runtime_error(path + " must be between 0.001 and 3600");
    }
    return std::chrono::milliseconds{std::llround(seconds * 1000)};
}

const Json::Value kEmpty(Json::objectValue);

const Json::Value& section(const Json::Value& config, const char* name) {
    if (config.isMember(name)) {
        if (!config[name].isObject()) {
            throw std::runtime_error(std::string(name) + " must be an object");
        }
        return config[name];
    }
    return kEmpty;
}

void loadStorage(const Json::Value& config, AppSettings& settings) {
    const auto& storage = section(config, "storage");
    if (auto backend = readString(storage, "backend")) {
        if (*backend == "postgres") {
            settings.backend = StorageBackend::Postgres;
        } else if (*backend == "memory") {
            settings.backend = StorageBackend::Memory;
        } else {
            throw std::runtime_error("storage.backend must be \"postgres\" or \"memory\"");
        }
    }

    if (auto rootDb = readString(config, "database_url")) {
        settings.dbUrl = *rootDb;
    }
    const auto& db = section(config, "database");
    if (auto nestedDb = readString(db, "url")) {
        settings.dbUrl = *nestedDb;
    }
    if (auto poolSize = readNumber(db, "pool_size", "database.pool_size")) {
        if (*poolSize < 0) {
            throw std::runtime_error("database.pool_size must not be negative");
        }
        settings.dbPoolSize = static_cast<size_t>(*poolSize);
    }
    if (auto timeout = readTimeout(db, "timeout_seconds", "database.timeout_seconds")) {
        settings.dbTimeout = *timeout;
    }
    if (settings.dbUrl.empty()) {
        if (auto envDb = readEnv("DATABASE_URL")) {
            settings.dbUrl = *envDb;
        }
    }
    if (settings.dbPoolSize == 0) {
        settings.dbPoolSize = 4;
    }
    if (settings.backend == StorageBackend::Postgres && settings.dbUrl.empty()) {
        throw std::runtime_error("DATABASE_URL or database.url config must be set");
    }
}

void loadRedis(const Json::Value& config, RedisSettings& redis) {
    const auto& node = section(config, "redis");
    if (auto host = readString(node, "host")) {
        redis.host = *host;
    } else if (auto envHost = readEnv("REDIS_HOST")) {
        redis.host = *envHost;
    }

    std::optional<long long> port = readNumber(node, "port", "redis.port");
    if (!port) {
        if (auto envPort = readEnv("REDIS_PORT")) {
            port = parseNumber(*envPort, "REDIS_PORT");
        }
    }
    if (port) {
        if (*port <= 0 || *port > std::numeric_limits<uint16_t>::max()) {
            throw std::runtime_error("redis.port out of range");
        }
        redis.port = static_cast<uint16_t>(*port);
    }

    if (auto password = readString(node, "password")) {
        redis.password = *password;
    } else if (auto envPassword = readEnv("REDIS_PASSWORD")) {
        redis.password = *envPassword;
    }
    if (auto db = readNumber(node, "db", "redis.db")) {
        if (*db < 0) {
            throw std::runtime_error("redis.db must not be negative");
        }
        redis.db = static_cast<unsigned int>(*db);
    }
    if (auto ttl = readNumber(node, "ttl_seconds", "redis.ttl_seconds")) {
        if (*ttl <= 0) {
            throw std::runtime_error("redis.ttl_seconds must be positive");
        }
        redis.ttl = std::chrono::seconds{*ttl};
    }
    if (auto timeout = readTimeout(node, "timeout_seconds", "redis.timeout_seconds")) {
        redis.timeout = *timeout;
    }
}

void loadShorten(const Json::Value& config, AppSettings& settings) {
    const auto& shorten = section(config, "shorten");
    if (auto attempts = readNumber(shorten, "max_attempts", "shorten.max_attempts")) {
        if (*attempts < 1 || *attempts > 100) {
            throw std::runtime_error("shorten.max_attempts must be between 1 and 100");
        }
        settings.maxAttempts = static_cast<int>(*attempts);
    }
    if (auto maxLength = readNumber(shorten, "max_url_length", "shorten.max_url_length")) {
        if (*maxLength < 1) {
            throw std::runtime_error("shorten.max_url_length must be positive");
        }
        settings.urlPolicy.maxLength = static_cast<size_t>(*maxLength);
    }
    if (shorten.isMember("allowed_schemes")) {
        const auto& schemes = shorten["allowed_schemes"];
        if (!schemes.isArray()) {
            throw std::runtime_error("shorten.allowed_schemes must be an array of strings");
        }
        settings.urlPolicy.allowedSchemes.clear();
        for (const auto& scheme : schemes) {
            if (!scheme.isString() || scheme.asString().empty()) {
                throw std::runtime_error("shorten.allowed_schemes must be an array of strings");
            }
            settings.urlPolicy.allowedSchemes.push_back(scheme.asString());
        }
    }
}
}

AppSettings loadSettings(const Json::Value& config) {
    if (!config.isNull() && !config.isObject()) {
        throw std::runtime_error("custom_config must be an object");
    }
    const Json::Value& root = config.isNull() ? kEmpty : config;

    AppSettings settings;

    if (auto rootBase = readString(root, "base_url")) {
        settings.baseUrl = *rootBase;
    }
    const auto& app = section(root, "app");
    if (auto nestedBase = readString(app, "base_url")) {
        settings.baseUrl = *nestedBase;
    }
    if (settings.baseUrl.empty()) {
        if (auto envBase = readEnv("BASE_URL")) {
            settings.baseUrl = *envBase;
        }
    }
    while (!settings.baseUrl.empty() && settings.baseUrl.back() == '/') {
        settings.baseUrl.pop_back();
    }

    loadStorage(root, settings);
    loadRedis(root, settings.redis);
    loadShorten(root, settings);

    return settings;
}
