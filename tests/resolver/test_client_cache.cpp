#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "vaultref/resolver/client_cache.hpp"
#include "support/fake_store.hpp"

using namespace vaultref;
using namespace vaultref::resolver;

namespace {

auto token_source(std::atomic<int>* calls = nullptr) -> AuthSource {
    return [calls]() -> Result<AuthMethodPtr> {
        if (calls) ++*calls;
        return make_token_auth("s.test");
    };
}

} // namespace

TEST_CASE("normalize_store_address", "[resolver][client_cache]") {
    CHECK(normalize_store_address("HTTPS://Vault.Example.com/") == "https://vault.example.com");
    CHECK(normalize_store_address("https://vault.example.com") == "https://vault.example.com");
    CHECK(normalize_store_address("https://v//") == "https://v/");
}

TEST_CASE("StoreClientCache builds once per address", "[resolver][client_cache]") {
    testing::FakeStoreFactory fake;
    StoreClientCache cache(fake.factory());
    std::atomic<int> auth_calls{0};

    auto first = cache.get_or_create("https://vault.example.com", token_source(&auth_calls), std::nullopt);
    REQUIRE(first.has_value());

    SECTION("same normalized address reuses the client") {
        auto second = cache.get_or_create("HTTPS://VAULT.example.com/", token_source(&auth_calls),
                                          std::nullopt);
        REQUIRE(second.has_value());
        CHECK(*first == *second);
        CHECK(fake.build_count() == 1);
        CHECK(auth_calls == 1);
        CHECK(cache.size() == 1);
    }

    SECTION("a different address builds another client") {
        auto other = cache.get_or_create("https://other.example.com", token_source(&auth_calls),
                                         std::string("ns1"));
        REQUIRE(other.has_value());
        CHECK(fake.build_count() == 2);
        CHECK(cache.size() == 2);
        REQUIRE(fake.seen->size() == 2);
        CHECK(fake.seen->at(1).address == "https://other.example.com");
        CHECK(fake.seen->at(1).namespace_id == "ns1");
        CHECK(std::get<TokenAuthInfo>(fake.seen->at(1).auth).token == "s.test");
    }

    SECTION("invalidate forces a rebuild") {
        CHECK(cache.invalidate("https://vault.example.com/"));
        CHECK_FALSE(cache.invalidate("https://vault.example.com"));
        CHECK(cache.size() == 0);
        auto again = cache.get_or_create("https://vault.example.com", token_source(), std::nullopt);
        REQUIRE(again.has_value());
        CHECK(fake.build_count() == 2);
    }
}

TEST_CASE("StoreClientCache failures are not cached", "[resolver][client_cache]") {
    SECTION("empty address") {
        testing::FakeStoreFactory fake;
        StoreClientCache cache(fake.factory());
        auto result = cache.get_or_create("", token_source(), std::nullopt);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
        CHECK(fake.build_count() == 0);
    }

    SECTION("auth failure propagates and leaves no entry") {
        testing::FakeStoreFactory fake;
        StoreClientCache cache(fake.factory());
        AuthSource failing = []() -> Result<AuthMethodPtr> {
            return std::unexpected(make_error(ErrorCode::InvalidConfig, "No authentication method configured"));
        };
        auto result = cache.get_or_create("https://v", failing, std::nullopt);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
        CHECK(cache.size() == 0);
        CHECK(fake.build_count() == 0);
    }

    SECTION("factory failure is wrapped and retried next time") {
        int attempts = 0;
        StoreClientCache cache([&attempts](const StoreClientSettings&) -> Result<StoreClientPtr> {
            if (++attempts == 1) {
                return std::unexpected(make_error(ErrorCode::ConnectionFailed, "boom"));
            }
            return std::make_shared<testing::FakeStoreClient>();
        });

        auto failed = cache.get_or_create("https://v", token_source(), std::nullopt);
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code() == ErrorCode::ConnectionFailed);
        REQUIRE(failed.error().cause() != nullptr);
        CHECK(failed.error().cause()->message() == "boom");
        CHECK(cache.size() == 0);

        auto ok = cache.get_or_create("https://v", token_source(), std::nullopt);
        REQUIRE(ok.has_value());
        CHECK(attempts == 2);
    }
}

TEST_CASE("StoreClientCache concurrent callers share one client", "[resolver][client_cache]") {
    testing::FakeStoreFactory fake;
    StoreClientCache cache(fake.factory());

    constexpr int kThreads = 16;
    std::vector<StoreClientPtr> clients(kThreads);
    std::vector<std::thread> threads;
    std::atomic<bool> go{false};

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            auto addr = (i % 2 == 0) ? "https://vault.example.com" : "https://VAULT.example.com/";
            auto client = cache.get_or_create(addr, token_source(), std::nullopt);
            if (client) clients[i] = *client;
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    CHECK(fake.build_count() == 1);
    CHECK(cache.size() == 1);
    for (const auto& c : clients) {
        REQUIRE(c != nullptr);
        CHECK(c == clients[0]);
    }
}

TEST_CASE("StoreClientCache selects auth outside its lock", "[resolver][client_cache]") {
    testing::FakeStoreFactory fake;
    StoreClientCache cache(fake.factory());

    std::promise<void> entered;
    std::promise<void> release;
    auto released = release.get_future().share();

    std::thread slow([&] {
        auto client = cache.get_or_create(
            "https://slow.example.com",
            [&]() -> Result<AuthMethodPtr> {
                entered.set_value();
                released.wait_for(std::chrono::seconds(5));
                return make_token_auth("s.slow");
            },
            std::nullopt);
        CHECK(client.has_value());
    });

    entered.get_future().wait();
    auto started = std::chrono::steady_clock::now();
    auto fast = cache.get_or_create("https://fast.example.com", token_source(), std::nullopt);
    auto elapsed = std::chrono::steady_clock::now() - started;
    release.set_value();
    slow.join();

    REQUIRE(fast.has_value());
    CHECK(elapsed < std::chrono::seconds(1));
    CHECK(cache.size() == 2);
}
