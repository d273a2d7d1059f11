#include "InMemoryLinkStore.h"
#include <functional>
#include <mutex>

InsertResult InMemoryLinkStore::insertIfAbsent(const ShortLink& link) {
    auto& shard = shards_[getShardIndex(link.code)];
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    bool inserted = shard.links.try_emplace(link.code, link).second;
    return inserted ? InsertResult::Inserted : InsertResult::Conflict;
}

std::optional<ShortLink> InMemoryLinkStore::get(const std::string& code) const {
    const auto& shard = shards_[getShardIndex(code)];
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.links.find(code);
    if (it == shard.links.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryLinkStore::ping() const {
    return true;
}

size_t InMemoryLinkStore::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        total += shard.links.size();
    }
    return total;
}

size_t InMemoryLinkStore::getShardIndex(const std::string& key) const {
    return std::hash<std::string>{}(key) % NUM_SHARDS;
}
