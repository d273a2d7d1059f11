#pragma once
#include "services/LinkStore.h"
#include "services/RedirectService.h"
#include "services/ShortenService.h"
#include <drogon/drogon.h>
#include <json/json.h>
#include <functional>
#include <memory>
#include <string>

class LinkController {
private:
    std::shared_ptr<ShortenService> shortenService_;
    std::shared_ptr<RedirectService> redirectService_;
    std::shared_ptr<LinkStore> store_;
    std::string baseUrl_;

    drogon::HttpResponsePtr createJsonResponse(
        const Json::Value& data,
        drogon::HttpStatusCode status = drogon::k200OK) const;

    drogon::HttpResponsePtr createErrorResponse(
        const std::string& message,
        drogon::HttpStatusCode status = drogon::k400BadRequest) const;

    drogon::HttpResponsePtr resolveFailure(const ResolveResult& result) const;

public:
    LinkController(std::shared_ptr<ShortenService> shortenService,
                   std::shared_ptr<RedirectService> redirectService,
                   std::shared_ptr<LinkStore> store,
                   std::string baseUrl);

    std::string getBaseUrl() const;

    // Health check endpoint
    void handleHealth(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback) const;

    // POST {"url": ...} -> 201 {"code", "short", "message"}
    void handleShorten(const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback) const;

    void handleInfo(const drogon::HttpRequestPtr& req,
                    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                    const std::string& code) const;

    // 301 to the stored URL
    void handleResolve(const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                       const std::string& code) const;
};
