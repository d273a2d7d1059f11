#include "AppSettings.h"
#include "CodeGenerator.h"
#include "HostResolver.h"
#include "LinkController.h"
#include "services/CachedLinkStore.h"
#include "services/InMemoryLinkStore.h"
#include "services/PgLinkStore.h"
#include "services/RedirectService.h"
#include "services/ShortenService.h"
#include <drogon/drogon.h>
#include <drogon/nosql/RedisClient.h>
#include <trantor/net/InetAddress.h>
#include <trantor/utils/Logger.h>
#include <chrono>
#include <memory>
#include <stdexcept>

using namespace std;
using namespace drogon;

namespace {
std::shared_ptr<LinkStore> makeStore(const AppSettings& settings) {
    std::shared_ptr<LinkStore> store;
    if (settings.backend == StorageBackend::Memory) {
        LOG_WARN << "Using in-memory link store; links are lost on restart";
        store = make_shared<InMemoryLinkStore>();
    } else {
        auto pgStore = make_shared<PgLinkStore>(settings.dbUrl, settings.dbPoolSize, settings.dbTimeout);
        pgStore->ensureSchema();
        store = pgStore;
    }

    if (!settings.redis.enabled()) {
        return store;
    }

    std::string resolvedIp = resolveHostWithRetry(settings.redis.host);
    if (resolvedIp.empty()) {
        throw std::runtime_error("could not resolve redis host '" + settings.redis.host + "'");
    }
    LOG_INFO << "Redis cache at " << settings.redis.host << " (" << resolvedIp << "):" << settings.redis.port
             << ", ttl " << settings.redis.ttl.count() << "s";
    trantor::InetAddress redisAddr(resolvedIp, settings.redis.port, resolvedIp.find(':') != std::string::npos);
    auto redisClient = drogon::nosql::RedisClient::newRedisClient(
        redisAddr, 1, settings.redis.password, settings.redis.db);
    // Without a timeout commands queue forever while Redis is down.
    redisClient->setTimeout(std::chrono::duration<double>(settings.redis.timeout).count());
    return make_shared<CachedLinkStore>(store, redisClient, settings.redis.ttl);
}
}

int main() {
    auto& app = drogon::app();
    app.loadConfigFile("config.json");

    std::shared_ptr<LinkController> controller;
    try {
        auto settings = loadSettings(app.getCustomConfig());
        auto store = makeStore(settings);
        auto generator = make_shared<RandomCodeGenerator>();
        auto shortenService = make_shared<ShortenService>(store, generator, settings.maxAttempts, settings.urlPolicy);
        auto redirectService = make_shared<RedirectService>(store);
        controller = make_shared<LinkController>(shortenService, redirectService, store, settings.baseUrl);
        LOG_INFO << "Short links served under " << controller->getBaseUrl();
    } catch (const std::exception& e) {
        LOG_FATAL << "Startup failed: " << e.what();
        return 1;
    }

    app.registerHandler("/api/v1/health",
        [controller](const HttpRequestPtr& req, function<void(const HttpResponsePtr&)>&& callback) {
            controller->handleHealth(req, move(callback));
        }, {Get});

    app.registerHandler("/api/v1/shorten",
        [controller](const HttpRequestPtr& req, function<void(const HttpResponsePtr&)>&& callback) {
            controller->handleShorten(req, move(callback));
        }, {Post});

    app.registerHandler("/api/v1/info/{1}",
        [controller](const HttpRequestPtr& req, function<void(const HttpResponsePtr&)>&& callback, const string& code) {
            controller->handleInfo(req, move(callback), code);
        }, {Get});

    app.registerHandler("/{1}",
        [controller](const HttpRequestPtr& req, function<void(const HttpResponsePtr&)>&& callback, const string& code) {
            controller->handleResolve(req, move(callback), code);
        }, {Get});

    app.run();
}
