#include "RedirectService.h"
#include "../utils.h"
#include <stdexcept>

RedirectService::RedirectService(std::shared_ptr<LinkStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("RedirectService dependencies missing");
    }
}

ResolveResult RedirectService::resolve(const std::string& code) const {
    ResolveResult result;
    if (!Base62::isCode(code)) {
        return result;
    }
    try {
        result.link = store_->get(code);
    } catch (const StoreUnavailable& e) {
        result.status = ResolveStatus::StoreUnavailable;
        result.error = e.what();
        return result;
    }
    if (result.link) {
        result.status = ResolveStatus::Found;
    }
    return result;
}
