#include "LinkController.h"
#include <trantor/utils/Logger.h>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

using namespace std;
using namespace drogon;

LinkController::LinkController(std::shared_ptr<ShortenService> shortenService,
                               std::shared_ptr<RedirectService> redirectService,
                               std::shared_ptr<LinkStore> store,
                               std::string baseUrl)
    : shortenService_(std::move(shortenService)),
      redirectService_(std::move(redirectService)),
      store_(std::move(store)),
      baseUrl_(std::move(baseUrl)) {
    if (!shortenService_ || !redirectService_ || !store_) {
        throw std::invalid_argument("Controller dependencies missing");
    }
}

HttpResponsePtr LinkController::createJsonResponse(const Json::Value& data, HttpStatusCode status) const {
    auto resp = HttpResponse::newHttpJsonResponse(data);
    resp->setStatusCode(status);
    return resp;
}

HttpResponsePtr LinkController::createErrorResponse(const string& message, HttpStatusCode status) const {
    Json::Value json;
    json["error"] = message;
    return createJsonResponse(json, status);
}

HttpResponsePtr LinkController::resolveFailure(const ResolveResult& result) const {
    if (result.status == ResolveStatus::StoreUnavailable) {
        return createErrorResponse("store unavailable", k503ServiceUnavailable);
    }
    return createErrorResponse("code not found", k404NotFound);
}

string LinkController::getBaseUrl() const {
    if (!baseUrl_.empty()) {
        return baseUrl_;
    }

    if (const char* envBase = getenv("BASE_URL")) {
        if (*envBase) {
            return string(envBase);
        }
    }
    const char* portEnv = getenv("APP_PORT");
    string port = portEnv && *portEnv ? portEnv : "9090";
    return "http://localhost:" + port;
}

void LinkController::handleHealth(const HttpRequestPtr& req,
                                  function<void(const HttpResponsePtr&)>&& callback) const {
    bool storeOk = store_->ping();
    auto resp = HttpResponse::newHttpResponse();
    resp->setContentTypeCode(CT_TEXT_PLAIN);
    if (storeOk) {
        resp->setStatusCode(k200OK);
        resp->setBody("ok");
    } else {
        resp->setStatusCode(k503ServiceUnavailable);
        resp->setBody("db-unavailable");
    }
    callback(resp);
}

void LinkController::handleShorten(const HttpRequestPtr& req,
                                   function<void(const HttpResponsePtr&)>&& callback) const {
    auto body = req->getJsonObject();

    if (!body || !body->isMember("url") || !(*body)["url"].isString()) {
        callback(createErrorResponse("invalid url, send {\"url\": \"https://example.com\"}"));
        return;
    }

    const string url = (*body)["url"].asString();
    auto result = shortenService_->shorten(url);

    switch (result.status) {
    case ShortenStatus::Created: {
        Json::Value response;
        response["message"] = "url shortened";
        response["code"] = result.code;
        response["short"] = getBaseUrl() + "/" + result.code;
        callback(createJsonResponse(response, k201Created));
        return;
    }
    case ShortenStatus::InvalidUrl:
        callback(createErrorResponse("invalid url, send {\"url\": \"https://example.com\"}"));
        return;
    case ShortenStatus::CapacityExhausted:
        callback(createErrorResponse("failed to generate a unique code", k500InternalServerError));
        return;
    case ShortenStatus::GeneratorFailed:
        callback(createErrorResponse("failed to generate a code", k500InternalServerError));
        return;
    case ShortenStatus::StoreUnavailable:
        LOG_ERROR << "shorten failed: " << result.error;
        callback(createErrorResponse("store unavailable", k503ServiceUnavailable));
        return;
    }
    callback(createErrorResponse("unexpected shorten status", k500InternalServerError));
}

void LinkController::handleInfo(const HttpRequestPtr& req,
                                function<void(const HttpResponsePtr&)>&& callback,
                                const string& code) const {
    auto result = redirectService_->resolve(code);
    if (!result.found()) {
        callback(resolveFailure(result));
        return;
    }
    Json::Value response;
    response["code"] = result.link->code;
    response["url"] = result.link->originalUrl;
    response["created_at"] = static_cast<Json::Int64>(
        std::chrono::duration_cast<std::chrono::seconds>(result.link->createdAt.time_since_epoch()).count());
    callback(createJsonResponse(response));
}

void LinkController::handleResolve(const HttpRequestPtr& req,
                                   function<void(const HttpResponsePtr&)>&& callback,
                                   const string& code) const {
    auto result = redirectService_->resolve(code);
    if (!result.found()) {
        callback(resolveFailure(result));
        return;
    }
    callback(HttpResponse::newRedirectionResponse(result.link->originalUrl, k301MovedPermanently));
}
