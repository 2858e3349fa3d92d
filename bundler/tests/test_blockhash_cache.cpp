#include <catch2/catch_test_macros.hpp>
#include "../src/blockhash_cache.hpp"
#include <atomic>
#include <thread>
#include <stdexcept>

TEST_CASE("Blockhash cache", "[blockhash]") {
    int fetches = 0;
    BlockhashCache cache([&fetches]() { return "hash-" + std::to_string(++fetches); },
                         std::chrono::milliseconds(60000));

    SECTION("Empty cache fetches once and then serves the cached value") {
        REQUIRE_FALSE(cache.peek().has_value());
        REQUIRE(cache.get() == "hash-1");
        REQUIRE(cache.get() == "hash-1");
        REQUIRE(cache.fetch_count() == 1);
    }

    SECTION("Refresh replaces the value") {
        cache.get();
        cache.refresh();
        REQUIRE(cache.peek().value() == "hash-2");
        REQUIRE(cache.get() == "hash-2");
    }

    SECTION("Stale values are fetched again") {
        BlockhashCache short_lived([&fetches]() { return "hash-" + std::to_string(++fetches); },
                                   std::chrono::milliseconds(0));
        short_lived.get();
        short_lived.get();
        REQUIRE(short_lived.fetch_count() == 2);
    }

    SECTION("Fetch errors propagate and leave the cache empty") {
        BlockhashCache failing([]() -> std::string { throw std::runtime_error("node unreachable"); });
        REQUIRE_THROWS_AS(failing.get(), std::runtime_error);
        REQUIRE_FALSE(failing.peek().has_value());
    }

    SECTION("Background refresh starts and stops") {
        std::atomic<int> background{0};
        BlockhashCache refreshed([&background]() { return "hash-" + std::to_string(++background); });
        refreshed.start(std::chrono::milliseconds(1));
        REQUIRE(refreshed.running());
        while (background.load() < 2) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        refreshed.stop();
        REQUIRE_FALSE(refreshed.running());
        REQUIRE(refreshed.peek().has_value());
    }
}
