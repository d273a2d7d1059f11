#pragma once
#include "../ShortLink.h"
#include "StoreUnavailable.h"
#include <optional>
#include <string>

enum class InsertResult {
    Inserted,
    Conflict
};

// Key-value persistence for ShortLinks keyed by code. Records are never
// updated or removed once inserted.
//
// Backends throw StoreUnavailable when they cannot answer.
class LinkStore {
public:
    virtual ~LinkStore() = default;

    // Creates the mapping only if link.code is absent. This is the only
    // synchronization point between concurrent writers.
    virtual InsertResult insertIfAbsent(const ShortLink& link) = 0;

    virtual std::optional<ShortLink> get(const std::string& code) const = 0;

    virtual bool ping() const = 0;
};
