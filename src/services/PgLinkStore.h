#pragma once
#include "LinkStore.h"
#include <drogon/orm/DbClient.h>
#include <chrono>
#include <string>

class PgLinkStore : public LinkStore {
public:
    // Commands that cannot reach the database fail with StoreUnavailable
    // after timeout instead of waiting for a reconnect.
    PgLinkStore(const std::string& uri,
                size_t poolSize = 4,
                std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    // Creates the short_link table when it does not exist yet.
    void ensureSchema();

    InsertResult insertIfAbsent(const ShortLink& link) override;
    std::optional<ShortLink> get(const std::string& code) const override;
    bool ping() const override;

    // Connection string with the password masked, suitable for logs.
    static std::string redact(const std::string& uri);

private:
    drogon::orm::DbClientPtr client_;
};
