#include <catch2/catch_test_macros.hpp>
#include "../src/failover_router.hpp"
#include "fake_http.hpp"
#include <algorithm>
#include <future>
#include <thread>

namespace {
RouterConfig fast_config() {
    RouterConfig cfg;
    cfg.backoff_base = std::chrono::milliseconds(1);
    cfg.confirm_poll_interval = std::chrono::milliseconds(1);
    cfg.max_retries = 3;
    return cfg;
}
}

TEST_CASE("Failover router construction", "[router]") {
    auto http = std::make_shared<FakeHttp>();

    SECTION("Zero providers is rejected") {
        REQUIRE_THROWS_AS(FailoverRouter(std::vector<std::string>{}, http), ConstructionError);
    }

    SECTION("Selection always lands on a configured provider") {
        std::vector<std::string> urls = {"https://a", "https://b", "https://c"};
        FailoverRouter router(urls, http, fast_config());

        const std::string& best = router.select_best();
        REQUIRE(std::find(urls.begin(), urls.end(), best) != urls.end());
        REQUIRE(router.provider_count() == 3);
    }
}

TEST_CASE("Failover across providers", "[router]") {
    auto http = std::make_shared<FakeHttp>();
    script_blockhash(*http);

    SECTION("Every provider failing exhausts exactly max_retries attempts") {
        http->on_url("https://a", FakeHttp::dead("refused by a"));
        http->on_url("https://b", FakeHttp::dead("refused by b"));
        http->on_url("https://c", FakeHttp::dead("refused by c"));
        FailoverRouter router({"https://a", "https://b", "https://c"}, http, fast_config());

        try {
            router.get_latest_blockhash();
            FAIL("expected AllProvidersExhausted");
        } catch (const AllProvidersExhausted& e) {
            REQUIRE(e.attempts() == 3);
            REQUIRE(e.last_provider() == "https://c");
            REQUIRE(e.last_error() == "refused by c");
            REQUIRE(std::string(e.what()).find("refused by c") != std::string::npos);
        }

        REQUIRE(http->calls("getLatestBlockhash") == 3);
        REQUIRE(http->url_calls("https://a") == 1);
        REQUIRE(http->url_calls("https://b") == 1);
        REQUIRE(http->url_calls("https://c") == 1);
    }

    SECTION("A failed call moves to the next provider") {
        http->on_url("https://a", FakeHttp::dead());
        http->on("sendTransaction", FakeHttp::result("5sigFromB"));
        FailoverRouter router({"https://a", "https://b"}, http, fast_config());

        REQUIRE(router.send_transaction("AQID") == "5sigFromB");
        REQUIRE(router.health(0).status == ProviderStatus::Degraded);
        REQUIRE(router.health(1).status == ProviderStatus::Healthy);
        REQUIRE(router.current_provider() == "https://b");
    }

    SECTION("Failing liveness checks demote a provider") {
        http->on_url("https://a", FakeHttp::dead());
        http->on("getHealth", FakeHttp::result("ok"));
        http->on("sendTransaction", FakeHttp::result("5sig"));
        FailoverRouter router({"https://a", "https://b"}, http, fast_config());

        for (int i = 0; i < 3; i++) {
            router.check_all_providers();
        }

        REQUIRE(router.health(0).status == ProviderStatus::Unhealthy);
        REQUIRE(router.health(0).last_error == "Connection refused");
        REQUIRE(router.current_provider() == "https://b");

        int calls_to_a = http->url_calls("https://a");
        router.send_transaction("AQID");
        REQUIRE(http->url_calls("https://a") == calls_to_a);

        auto summary = router.health_summary();
        REQUIRE(summary["current_provider"] == "https://b");
        REQUIRE(summary["providers"].size() == 2);
    }

    SECTION("Timed out liveness checks are recorded as timeouts") {
        http->on_url("https://a", [](const std::string&, const nlohmann::json&) -> HttpResponse {
            throw TransportError("Operation timed out after 5000 milliseconds", true);
        });
        FailoverRouter router({"https://a"}, http, fast_config());

        router.check_provider(0);
        REQUIRE(router.health(0).last_error == "Timeout");
    }
}

TEST_CASE("Router blockhash and confirmation", "[router]") {
    auto http = std::make_shared<FakeHttp>();
    script_blockhash(*http);
    FailoverRouter router({"https://a", "https://b"}, http, fast_config());

    SECTION("Cached blockhash is fetched once") {
        REQUIRE(router.get_cached_blockhash() == TEST_BLOCKHASH);
        REQUIRE(router.get_cached_blockhash() == TEST_BLOCKHASH);
        REQUIRE(http->calls("getLatestBlockhash") == 1);
    }

    SECTION("Confirmation reports on-chain errors as unconfirmed") {
        http->on("getSignatureStatuses", FakeHttp::result({
            {"context", {{"slot", 1}}},
            {"value", nlohmann::json::array({
                {{"confirmationStatus", "confirmed"}, {"err", {{"InstructionError", {0, "Custom"}}}}}
            })}
        }));
        REQUIRE_FALSE(router.confirm_transaction("5sig"));
    }

    SECTION("Confirmation succeeds once the commitment is reached") {
        int polls = 0;
        http->on("getSignatureStatuses", [&polls](const std::string&, const nlohmann::json&) {
            polls++;
            nlohmann::json status = polls < 3
                ? nlohmann::json{{"confirmationStatus", "processed"}, {"err", nullptr}}
                : nlohmann::json{{"confirmationStatus", "confirmed"}, {"err", nullptr}};
            return HttpResponse{200, FakeHttp::rpc_result({{"value", nlohmann::json::array({status})}})};
        });
        REQUIRE(router.confirm_transaction("5sig", "confirmed"));
        REQUIRE(polls == 3);
    }

    SECTION("Confirmation gives up at max_wait") {
        http->on("getSignatureStatuses", FakeHttp::result({{"value", nlohmann::json::array({nullptr})}}));
        REQUIRE_FALSE(router.confirm_transaction("5sig", "confirmed", std::chrono::milliseconds(5)));
    }
}

TEST_CASE("Router lifecycle", "[router]") {
    auto http = std::make_shared<FakeHttp>();
    script_blockhash(*http);
    http->on("getHealth", FakeHttp::result("ok"));

    SECTION("Start checks every provider and selects a live one") {
        http->on_url("https://a", FakeHttp::dead());
        auto cfg = fast_config();
        cfg.health_check_interval = std::chrono::milliseconds(60000);
        cfg.blockhash_refresh_interval = std::chrono::milliseconds(60000);
        FailoverRouter router({"https://a", "https://b"}, http, cfg);

        router.start();
        REQUIRE(router.running());
        REQUIRE(router.current_provider() == "https://b");
        REQUIRE(router.health(0).total_requests == 1);
        REQUIRE(router.health(1).status == ProviderStatus::Healthy);

        router.start();
        REQUIRE(http->calls("getHealth") == 2);

        router.stop();
        REQUIRE_FALSE(router.running());
    }

    SECTION("Both loops run until stop and nothing is called afterwards") {
        auto cfg = fast_config();
        cfg.health_check_interval = std::chrono::milliseconds(1);
        cfg.blockhash_refresh_interval = std::chrono::milliseconds(1);
        FailoverRouter router({"https://a", "https://b"}, http, cfg);

        router.start();
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while ((http->calls("getHealth") < 6 || http->calls("getLatestBlockhash") < 2) &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        REQUIRE(http->calls("getHealth") >= 6);
        REQUIRE(http->calls("getLatestBlockhash") >= 2);

        router.stop();
        int after_stop = http->total_calls();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE(http->total_calls() == after_stop);
        REQUIRE(router.blockhash_cache().peek().value() == TEST_BLOCKHASH);
    }

    SECTION("Stop closes idle connections to every provider") {
        FailoverRouter router({"https://a", "https://b"}, http, fast_config());
        router.stop();

        auto closed = http->closed();
        REQUIRE(std::count(closed.begin(), closed.end(), "https://a") == 1);
        REQUIRE(std::count(closed.begin(), closed.end(), "https://b") == 1);
    }
}

TEST_CASE("Failover after stop", "[router]") {
    auto http = std::make_shared<FakeHttp>();
    http->on("getHealth", FakeHttp::result("ok"));
    http->on("sendTransaction", FakeHttp::dead());

    SECTION("Stopping an idle router keeps the full retry count") {
        FailoverRouter router({"https://a", "https://b"}, http, fast_config());
        router.stop();

        REQUIRE_THROWS_AS(router.send_transaction("AQID"), AllProvidersExhausted);
        REQUIRE(http->calls("sendTransaction") == 3);
    }

    SECTION("A started and stopped router keeps the full retry count") {
        auto cfg = fast_config();
        cfg.health_check_interval = std::chrono::milliseconds(60000);
        cfg.blockhash_refresh_interval = std::chrono::milliseconds(60000);
        FailoverRouter router({"https://a", "https://b"}, http, cfg);
        router.start();
        router.stop();

        try {
            router.send_transaction("AQID");
            FAIL("expected AllProvidersExhausted");
        } catch (const AllProvidersExhausted& e) {
            REQUIRE(e.attempts() == 3);
        }
    }

    SECTION("Stop wakes a backoff in progress") {
        auto cfg = fast_config();
        cfg.backoff_base = std::chrono::milliseconds(60000);
        FailoverRouter router({"https://a", "https://b"}, http, cfg);

        auto sending = std::async(std::launch::async, [&router]() {
            try {
                router.send_transaction("AQID");
                return 0;
            } catch (const AllProvidersExhausted& e) {
                return e.attempts();
            }
        });
        while (sending.wait_for(std::chrono::milliseconds(5)) != std::future_status::ready) {
            router.stop();
        }
        REQUIRE(sending.get() == 1);
    }
}
