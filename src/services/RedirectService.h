#pragma once
#include "LinkStore.h"
#include <memory>
#include <optional>
#include <string>

enum class ResolveStatus {
    Found,
    NotFound,
    StoreUnavailable
};

struct ResolveResult {
    ResolveStatus status{ResolveStatus::NotFound};
    std::optional<ShortLink> link;
    std::string error;

    bool found() const { return status == ResolveStatus::Found; }
};

class RedirectService {
public:
    explicit RedirectService(std::shared_ptr<LinkStore> store);

    // One read against the store; strings that can never be codes are
    // answered without one.
    ResolveResult resolve(const std::string& code) const;

private:
    std::shared_ptr<LinkStore> store_;
};
