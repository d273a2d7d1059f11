#pragma once
#include "LinkStore.h"
#include <drogon/nosql/RedisClient.h>
#include <chrono>
#include <memory>

// Redis cache in front of another LinkStore. Links never change once stored,
// so a cached entry is always current; the TTL only bounds memory use.
class CachedLinkStore : public LinkStore {
public:
    CachedLinkStore(std::shared_ptr<LinkStore> backing,
                    drogon::nosql::RedisClientPtr redisClient,
                    std::chrono::seconds ttl = std::chrono::seconds{86400});

    InsertResult insertIfAbsent(const ShortLink& link) override;
    std::optional<ShortLink> get(const std::string& code) const override;
    bool ping() const override;

    static std::string cacheKey(const std::string& code);
    static std::string encodeEntry(const ShortLink& link);
    static std::optional<ShortLink> decodeEntry(const std::string& code, const std::string& payload);

private:
    std::shared_ptr<LinkStore> backing_;
    drogon::nosql::RedisClientPtr redisClient_;
    std::chrono::seconds ttl_;

    void remember(const ShortLink& link) const;
    std::optional<ShortLink> lookup(const std::string& code) const;
};
