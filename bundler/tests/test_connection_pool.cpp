#include <catch2/catch_test_macros.hpp>
#include "../src/connection_pool.hpp"
#include "../src/failover_router.hpp"
#include "../src/http_client.hpp"
#include <future>
#include <memory>
#include <stdexcept>

TEST_CASE("Connection pool limits", "[http]") {
    PoolLimits limits;
    limits.max_total = 2;
    limits.max_per_host = 1;
    ConnectionPool pool(limits);

    SECTION("Released handles are kept for reuse") {
        {
            auto lease = pool.acquire("https://rpc-a.example/");
            REQUIRE(lease.get() != nullptr);
            REQUIRE(pool.in_use() == 1);
        }
        REQUIRE(pool.in_use() == 0);
        REQUIRE(pool.idle() == 1);

        auto again = pool.acquire("https://rpc-a.example/other");
        REQUIRE(pool.idle() == 0);
    }

    SECTION("Per-host limit blocks until a handle is returned") {
        auto first = std::make_unique<ConnectionPool::Lease>(pool.acquire("https://rpc-a.example/"));
        auto other_host = pool.acquire("https://rpc-b.example/");
        REQUIRE(pool.in_use() == 2);

        auto waiting = std::async(std::launch::async, [&pool]() {
            auto lease = pool.acquire("https://rpc-a.example/");
            return lease.get() != nullptr;
        });
        REQUIRE(waiting.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);

        first.reset();
        REQUIRE(waiting.get());
    }

    SECTION("Closing idle handles for one host leaves the others") {
        {
            auto a = pool.acquire("https://rpc-a.example/");
            auto b = pool.acquire("https://rpc-b.example/");
        }
        REQUIRE(pool.idle() == 2);

        REQUIRE(pool.close_idle("https://rpc-a.example/any") == 1);
        REQUIRE(pool.idle("https://rpc-a.example/") == 0);
        REQUIRE(pool.idle("https://rpc-b.example/") == 1);
        REQUIRE(pool.close_idle("https://rpc-c.example/") == 0);
    }

    SECTION("Shutdown rejects new leases") {
        pool.shutdown();
        REQUIRE_THROWS_AS(pool.acquire("https://rpc-a.example/"), std::runtime_error);
    }

    SECTION("Zero limits are rejected") {
        PoolLimits bad;
        bad.max_per_host = 0;
        REQUIRE_THROWS_AS(ConnectionPool(bad), std::invalid_argument);
    }
}

TEST_CASE("Router stop releases provider connections", "[http]") {
    auto pool = std::make_shared<ConnectionPool>();
    auto http = std::make_shared<CurlHttpClient>(pool);
    FailoverRouter router({"https://rpc-a.example/", "https://rpc-b.example/"}, http);

    {
        auto a = pool->acquire("https://rpc-a.example/");
        auto b = pool->acquire("https://rpc-b.example/");
        auto other = pool->acquire("https://relay.example/");
    }
    REQUIRE(pool->idle() == 3);

    router.stop();
    REQUIRE(pool->idle("https://rpc-a.example/") == 0);
    REQUIRE(pool->idle("https://rpc-b.example/") == 0);
    REQUIRE(pool->idle("https://relay.example/") == 1);
}
