#include "CachedLinkStore.h"
#include <drogon/nosql/RedisException.h>
#include <drogon/nosql/RedisResult.h>
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include <memory>
#include <stdexcept>

using namespace std::chrono;
using drogon::nosql::RedisException;
using drogon::nosql::RedisResult;

namespace {
std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}
}

CachedLinkStore::CachedLinkStore(std::shared_ptr<LinkStore> backing,
                                 drogon::nosql::RedisClientPtr redisClient,
                                 seconds ttl)
    : backing_(std::move(backing)),
      redisClient_(std::move(redisClient)),
      ttl_(ttl) {
    if (!backing_ || !redisClient_) {
        throw std::invalid_argument("CachedLinkStore dependencies missing");
    }
    if (ttl_.count() <= 0) {
        throw std::invalid_argument("cache TTL must be positive");
    }
}

InsertResult CachedLinkStore::insertIfAbsent(const ShortLink& link) {
    auto result = backing_->insertIfAbsent(link);
    if (result == InsertResult::Inserted) {
        remember(link);
    }
    return result;
}

std::optional<ShortLink> CachedLinkStore::get(const std::string& code) const {
    if (auto cached = lookup(code)) {
        return cached;
    }
    auto link = backing_->get(code);
    if (link) {
        remember(*link);
    }
    return link;
}

bool CachedLinkStore::ping() const {
    return backing_->ping();
}

std::string CachedLinkStore::cacheKey(const std::string& code) {
    return "shortlink:" + code;
}

std::string CachedLinkStore::encodeEntry(const ShortLink& link) {
    Json::Value json;
    json["url"] = link.originalUrl;
    json["created_at_us"] = static_cast<Json::Int64>(
        duration_cast<microseconds>(link.createdAt.time_since_epoch()).count());
    return compactJson(json);
}

std::optional<ShortLink> CachedLinkStore::decodeEntry(const std::string& code,
                                                      const std::string& payload) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value json;
    std::string errors;
    if (!reader->parse(payload.data(), payload.data() + payload.size(), &json, &errors)) {
        return std::nullopt;
    }
    if (!json.isObject() || !json["url"].isString() || !json["created_at_us"].isInt64()) {
        return std::nullopt;
    }
    ShortLink link;
    link.code = code;
    link.originalUrl = json["url"].asString();
    link.createdAt = ShortLink::TimePoint(microseconds(json["created_at_us"].asInt64()));
    return link;
}

void CachedLinkStore::remember(const ShortLink& link) const {
    const auto key = cacheKey(link.code);
    const auto payload = encodeEntry(link);
    const auto ttl = static_cast<long long>(ttl_.count());
    try {
        redisClient_->execCommandSync<bool>(
            [](const RedisResult&) { return true; },
            "setex %s %lld %s", key.c_str(), ttl, payload.c_str());
    } catch (const RedisException& e) {
        LOG_WARN << "[redis] setex " << key << " failed: " << e.what();
    }
}

std::optional<ShortLink> CachedLinkStore::lookup(const std::string& code) const {
    const auto key = cacheKey(code);
    try {
        auto payload = redisClient_->execCommandSync<std::optional<std::string>>(
            [](const RedisResult& r) -> std::optional<std::string> {
                if (r.isNil()) {
                    return std::nullopt;
                }
                return r.asString();
            },
            "get %s", key.c_str());
        if (!payload) {
            LOG_TRACE << "[redis] cache miss for code: " << code;
            return std::nullopt;
        }
        auto link = decodeEntry(code, *payload);
        if (!link) {
            LOG_WARN << "[redis] discarding malformed cache entry for code: " << code;
        }
        return link;
    } catch (const RedisException& e) {
        LOG_WARN << "[redis] get " << key << " failed: " << e.what();
        return std::nullopt;
    }
}
