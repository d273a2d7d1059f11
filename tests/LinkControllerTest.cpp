#include "../src/LinkController.h"
#include "TestDoubles.h"
#include <drogon/drogon.h>
#include <drogon/drogon_test.h>
#include <json/json.h>
#include <memory>

using namespace drogon;

namespace {
struct Fixture {
    std::shared_ptr<LinkStore> store;
    std::shared_ptr<LinkController> controller;
};

Fixture makeFixture(std::shared_ptr<LinkStore> store,
                    std::shared_ptr<CodeGenerator> generator = std::make_shared<RandomCodeGenerator>()) {
    auto shortener = std::make_shared<ShortenService>(store, generator);
    auto redirects = std::make_shared<RedirectService>(store);
    auto controller = std::make_shared<LinkController>(shortener, redirects, store, "https://sho.rt");
    return Fixture{store, controller};
}

HttpResponsePtr postShorten(const LinkController& controller, const Json::Value& body) {
    auto req = HttpRequest::newHttpJsonRequest(body);
    req->setMethod(Post);
    req->setPath("/api/v1/shorten");
    HttpResponsePtr response;
    controller.handleShorten(req, [&response](const HttpResponsePtr& resp) { response = resp; });
    return response;
}

HttpResponsePtr get(const LinkController& controller, const std::string& code, bool info) {
    auto req = HttpRequest::newHttpRequest();
    req->setMethod(Get);
    HttpResponsePtr response;
    auto capture = [&response](const HttpResponsePtr& resp) { response = resp; };
    if (info) {
        controller.handleInfo(req, capture, code);
    } else {
        controller.handleResolve(req, capture, code);
    }
    return response;
}
}

DROGON_TEST(ControllerShortenThenRedirect)
{
    auto fixture = makeFixture(std::make_shared<InMemoryLinkStore>());

    Json::Value body;
    body["url"] = "https://example.com/landing?ref=1";
    auto created = postShorten(*fixture.controller, body);
    REQUIRE(created != nullptr);
    CHECK(created->getStatusCode() == k201Created);
    auto json = created->getJsonObject();
    REQUIRE(json != nullptr);
    auto code = (*json)["code"].asString();
    CHECK(code.size() == 6);
    CHECK((*json)["short"].asString() == "https://sho.rt/" + code);

    auto redirect = get(*fixture.controller, code, false);
    REQUIRE(redirect != nullptr);
    CHECK(redirect->getStatusCode() == k301MovedPermanently);
    CHECK(redirect->getHeader("Location") == "https://example.com/landing?ref=1");

    auto info = get(*fixture.controller, code, true);
    REQUIRE(info != nullptr);
    CHECK(info->getStatusCode() == k200OK);
    auto infoJson = info->getJsonObject();
    REQUIRE(infoJson != nullptr);
    CHECK((*infoJson)["code"].asString() == code);
    CHECK((*infoJson)["url"].asString() == "https://example.com/landing?ref=1");
    CHECK((*infoJson)["created_at"].asInt64() > 0);
}

DROGON_TEST(ControllerShortenRejectsBadRequests)
{
    auto store = std::make_shared<InMemoryLinkStore>();
    auto fixture = makeFixture(store);

    Json::Value noUrl;
    noUrl["link"] = "https://example.com";
    CHECK(postShorten(*fixture.controller, noUrl)->getStatusCode() == k400BadRequest);

    Json::Value numericUrl;
    numericUrl["url"] = 42;
    CHECK(postShorten(*fixture.controller, numericUrl)->getStatusCode() == k400BadRequest);

    Json::Value invalid;
    invalid["url"] = "not a url";
    auto resp = postShorten(*fixture.controller, invalid);
    CHECK(resp->getStatusCode() == k400BadRequest);
    REQUIRE(resp->getJsonObject() != nullptr);
    CHECK((*resp->getJsonObject()).isMember("error"));

    CHECK(store->size() == 0);
}

DROGON_TEST(ControllerMapsServerFailures)
{
    Json::Value body;
    body["url"] = "https://example.com";

    auto exhausted = makeFixture(std::make_shared<AlwaysConflictStore>());
    CHECK(postShorten(*exhausted.controller, body)->getStatusCode() == k500InternalServerError);

    auto noEntropy = makeFixture(std::make_shared<InMemoryLinkStore>(), std::make_shared<FailingCodeGenerator>());
    HttpResponsePtr failed;
    CHECK_NOTHROW(failed = postShorten(*noEntropy.controller, body));
    REQUIRE(failed != nullptr);
    CHECK(failed->getStatusCode() == k500InternalServerError);

    auto unavailable = makeFixture(std::make_shared<UnavailableStore>());
    CHECK(postShorten(*unavailable.controller, body)->getStatusCode() == k503ServiceUnavailable);
    CHECK(get(*unavailable.controller, "aB92kZ", false)->getStatusCode() == k503ServiceUnavailable);
    CHECK(get(*unavailable.controller, "aB92kZ", true)->getStatusCode() == k503ServiceUnavailable);
}

DROGON_TEST(ControllerUnknownCode)
{
    auto fixture = makeFixture(std::make_shared<InMemoryLinkStore>());
    CHECK(get(*fixture.controller, "zzzzzz", false)->getStatusCode() == k404NotFound);
    CHECK(get(*fixture.controller, "zzzzzz", true)->getStatusCode() == k404NotFound);
    CHECK(get(*fixture.controller, "favicon.ico", false)->getStatusCode() == k404NotFound);
}

DROGON_TEST(ControllerHealth)
{
    auto healthy = makeFixture(std::make_shared<InMemoryLinkStore>());
    HttpResponsePtr response;
    healthy.controller->handleHealth(HttpRequest::newHttpRequest(),
                                     [&response](const HttpResponsePtr& resp) { response = resp; });
    REQUIRE(response != nullptr);
    CHECK(response->getStatusCode() == k200OK);
    CHECK(std::string(response->getBody()) == "ok");

    auto broken = makeFixture(std::make_shared<UnavailableStore>());
    broken.controller->handleHealth(HttpRequest::newHttpRequest(),
                                    [&response](const HttpResponsePtr& resp) { response = resp; });
    CHECK(response->getStatusCode() == k503ServiceUnavailable);
    CHECK(std::string(response->getBody()) == "db-unavailable");
}
