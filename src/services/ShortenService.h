#pragma once
#include "../CodeGenerator.h"
#include "LinkStore.h"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

enum class ShortenStatus {
    Created,
    InvalidUrl,
    CapacityExhausted,
    StoreUnavailable,
    GeneratorFailed
};

struct ShortenResult {
    ShortenStatus status{ShortenStatus::InvalidUrl};
    std::string code;
    int attempts{0};
    std::string error;

    bool ok() const { return status == ShortenStatus::Created; }
};

// Which URLs are accepted for shortening.
struct UrlPolicy {
    std::vector<std::string> allowedSchemes{"http", "https"};
    size_t maxLength{2048};
};

class ShortenService {
public:
    static constexpr int kDefaultMaxAttempts = 5;

    ShortenService(std::shared_ptr<LinkStore> store,
                   std::shared_ptr<CodeGenerator> generator,
                   int maxAttempts = kDefaultMaxAttempts,
                   UrlPolicy policy = UrlPolicy{});

    // Validates url, then draws candidates until the store accepts one or
    // maxAttempts conditional inserts have collided. Nothing is written for
    // an invalid url.
    ShortenResult shorten(const std::string& url) const;

    bool isValidUrl(std::string_view url) const;

    int maxAttempts() const { return maxAttempts_; }

    // Absolute URI check: scheme "://" authority with a non-empty host.
    // An empty scheme list accepts any syntactically valid scheme.
    static bool isValidUrl(std::string_view url, const UrlPolicy& policy);

private:
    std::shared_ptr<LinkStore> store_;
    std::shared_ptr<CodeGenerator> generator_;
    int maxAttempts_;
    UrlPolicy policy_;
};
