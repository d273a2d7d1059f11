#pragma once
#include "LinkStore.h"
#include <array>
#include <shared_mutex>
#include <unordered_map>

class InMemoryLinkStore : public LinkStore {
public:
    InsertResult insertIfAbsent(const ShortLink& link) override;
    std::optional<ShortLink> get(const std::string& code) const override;
    bool ping() const override;

    size_t size() const;

private:
    // Sharded mutexes for better concurrency
    static constexpr size_t NUM_SHARDS = 16;

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, ShortLink> links;
    };

    std::array<Shard, NUM_SHARDS> shards_;

    size_t getShardIndex(const std::string& key) const;
};
