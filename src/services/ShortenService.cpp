#include "ShortenService.h"
#include <trantor/utils/Logger.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace {
bool isSchemeChar(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

// Host part of an authority ("user@host:port"); empty when malformed.
std::string_view hostOf(std::string_view authority) {
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host;
    std::string_view rest;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos || close == 1) {
            return {};
        }
        host = authority.substr(0, close + 1);
        rest = authority.substr(close + 1);
        if (!rest.empty() && rest.front() != ':') {
            return {};
        }
    } else {
        auto colon = authority.find(':');
        host = authority.substr(0, colon);
        rest = colon == std::string_view::npos ? std::string_view{} : authority.substr(colon);
    }

    if (!rest.empty()) {
        auto port = rest.substr(1);
        if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return {};
        }
    }
    return host;
}
}

ShortenService::ShortenService(std::shared_ptr<LinkStore> store,
                               std::shared_ptr<CodeGenerator> generator,
                               int maxAttempts,
                               UrlPolicy policy)
    : store_(std::move(store)),
      generator_(std::move(generator)),
      maxAttempts_(maxAttempts),
      policy_(std::move(policy)) {
    if (!store_ || !generator_) {
        throw std::invalid_argument("ShortenService dependencies missing");
    }
    if (maxAttempts_ < 1) {
        throw std::invalid_argument("maxAttempts must be at least 1");
    }
}

ShortenResult ShortenService::shorten(const std::string& url) const {
    ShortenResult result;
    if (!isValidUrl(url)) {
        result.status = ShortenStatus::InvalidUrl;
        result.error = "invalid url";
        return result;
    }

    for (int attempt = 1; attempt <= maxAttempts_; ++attempt) {
        ShortLink link{{}, url, std::chrono::system_clock::now()};
        result.attempts = attempt;
        try {
            link.code = generator_->nextCandidate();
        } catch (const std::runtime_error& e) {
            LOG_ERROR << "code generation failed: " << e.what();
            result.status = ShortenStatus::GeneratorFailed;
            result.error = e.what();
            return result;
        }
        try {
            if (store_->insertIfAbsent(link) == InsertResult::Inserted) {
                result.status = ShortenStatus::Created;
                result.code = std::move(link.code);
                return result;
            }
        } catch (const StoreUnavailable& e) {
            result.status = ShortenStatus::StoreUnavailable;
            result.error = e.what();
            return result;
        }
        LOG_DEBUG << "code collision on " << link.code << " (attempt " << attempt << ")";
    }

    LOG_WARN << "no free code after " << maxAttempts_ << " attempts";
    result.status = ShortenStatus::CapacityExhausted;
    result.error = "unable to allocate a unique code";
    return result;
}

bool ShortenService::isValidUrl(std::string_view url) const {
    return isValidUrl(url, policy_);
}

bool ShortenService::isValidUrl(std::string_view url, const UrlPolicy& policy) {
    if (url.empty() || url.size() > policy.maxLength) {
        return false;
    }
    if (std::any_of(url.begin(), url.end(), [](unsigned char c) {
            return std::isspace(c) || std::iscntrl(c);
        })) {
        return false;
    }

    auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) {
        return false;
    }
    auto scheme = url.substr(0, sep);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front())) ||
        !std::all_of(scheme.begin(), scheme.end(), isSchemeChar)) {
        return false;
    }
    if (!policy.allowedSchemes.empty() &&
        std::none_of(policy.allowedSchemes.begin(), policy.allowedSchemes.end(),
                     [scheme](const std::string& allowed) { return equalsIgnoreCase(scheme, allowed); })) {
        return false;
    }

    auto rest = url.substr(sep + 3);
    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    return !hostOf(authority).empty();
}
