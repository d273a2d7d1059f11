#include "../src/services/StoreUnavailable.h"
#include "../src/services/InMemoryLinkStore.h"
#include <drogon/drogon_test.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace {
ShortLink makeLink(const std::string& code, const std::string& url) {
    return ShortLink{code, url, std::chrono::system_clock::now()};
}
}

DROGON_TEST(InMemoryStoreInsertAndGet)
{
    InMemoryLinkStore store;
    auto link = makeLink("abc123", "https://example.com/a");

    CHECK(store.insertIfAbsent(link) == InsertResult::Inserted);
    CHECK(store.size() == 1);

    auto found = store.get("abc123");
    REQUIRE(found.has_value());
    CHECK(found->code == "abc123");
    CHECK(found->originalUrl == "https://example.com/a");
    CHECK(found->createdAt == link.createdAt);

    CHECK(!store.get("zzz999").has_value());
    CHECK(store.ping());
}

DROGON_TEST(InMemoryStoreKeepsFirstWriter)
{
    InMemoryLinkStore store;
    CHECK(store.insertIfAbsent(makeLink("abc123", "https://first.example")) == InsertResult::Inserted);
    CHECK(store.insertIfAbsent(makeLink("abc123", "https://second.example")) == InsertResult::Conflict);

    CHECK(store.size() == 1);
    auto found = store.get("abc123");
    REQUIRE(found.has_value());
    CHECK(found->originalUrl == "https://first.example");
}

DROGON_TEST(InMemoryStoreSingleWinnerUnderContention)
{
    InMemoryLinkStore store;
    std::atomic<int> inserted{0};
    std::atomic<int> conflicts{0};

    std::vector<std::thread> writers;
    for (int i = 0; i < 8; ++i) {
        writers.emplace_back([&store, &inserted, &conflicts, i]() {
            auto link = makeLink("RACE00", "https://writer" + std::to_string(i) + ".example");
            if (store.insertIfAbsent(link) == InsertResult::Inserted) {
                ++inserted;
            } else {
                ++conflicts;
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }

    CHECK(inserted.load() == 1);
    CHECK(conflicts.load() == 7);
    CHECK(store.size() == 1);
}

DROGON_TEST(StoreUnavailableCarriesMessage)
{
    std::string message = "connection refused";
    StoreUnavailable error(message);
    CHECK(std::string(error.what()) == "connection refused");
    CHECK_THROWS_AS(throw StoreUnavailable("timeout"), std::runtime_error);
}
