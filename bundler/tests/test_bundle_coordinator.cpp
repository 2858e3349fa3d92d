#include <catch2/catch_test_macros.hpp>
#include "../src/bundle_coordinator.hpp"
#include "fake_http.hpp"
#include <algorithm>

namespace {

struct Harness {
    std::shared_ptr<FakeHttp> http = std::make_shared<FakeHttp>();
    std::shared_ptr<ResilientClient> client;
    std::shared_ptr<IdentityPool> pool;
    std::shared_ptr<FakeBuilder> builder = std::make_shared<FakeBuilder>();
    std::shared_ptr<FakeRelay> relay = std::make_shared<FakeRelay>();
    std::map<std::string, uint64_t> token_balances;

    Harness() {
        script_blockhash(*http);
        script_balance(*http, 0);

        http->on("getTokenAccountsByOwner", [](const std::string&, const nlohmann::json& req) {
            std::string owner = req["params"][0].get<std::string>();
            return HttpResponse{200, FakeHttp::rpc_result({
                {"value", nlohmann::json::array({{{"pubkey", owner}}})}
            })};
        });
        http->on("getTokenAccountBalance", [this](const std::string&, const nlohmann::json& req) {
            std::string account = req["params"][0].get<std::string>();
            auto it = token_balances.find(account);
            uint64_t amount = it == token_balances.end() ? 0 : it->second;
            return HttpResponse{200, FakeHttp::rpc_result({
                {"value", {{"amount", std::to_string(amount)}, {"decimals", 6}}}
            })};
        });

        client = std::make_shared<ResilientClient>("https://rpc", http);

        PoolConfig cfg;
        cfg.num_identities = 3;
        cfg.transfer_delay = std::chrono::milliseconds(0);
        pool = std::make_shared<IdentityPool>(client, cfg);
        pool->initialize(Keypair::generate());
    }

    std::string owner(size_t index) const {
        return pool->get_identity(index).keypair.pubkey().to_string();
    }

    BundleCoordinator coordinator(CoordinatorConfig cfg = CoordinatorConfig{}) {
        cfg.retry_delay = std::chrono::milliseconds(1);
        return BundleCoordinator(pool, client, builder, relay, cfg);
    }
};

}

TEST_CASE("Tip escalation", "[bundle]") {
    Harness h;

    SECTION("Each retry raises the tip by the increment") {
        auto coordinator = h.coordinator();
        auto result = coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.attempts == 3);
        REQUIRE(h.relay->tips == std::vector<uint64_t>{100000000, 150000000, 200000000});
        REQUIRE(result.tip_paid == 0);
        REQUIRE(result.last_tip == 200000000);
        REQUIRE(result.error_message == "HTTP 429: rate limited");
    }

    SECTION("Tips never exceed the maximum") {
        CoordinatorConfig cfg;
        cfg.initial_tip = 900000000;
        cfg.max_tip = 920000000;
        auto coordinator = h.coordinator(cfg);
        coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);

        REQUIRE(h.relay->tips == std::vector<uint64_t>{900000000, 920000000, 920000000});
    }

    SECTION("Landing stops the retries and records the tip paid") {
        h.relay->succeed_on_attempt = 2;
        auto coordinator = h.coordinator();
        auto result = coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);

        REQUIRE(result.success);
        REQUIRE(result.bundle_id == "bundle-2");
        REQUIRE(result.attempts == 2);
        REQUIRE(result.tip_paid == 150000000);
        REQUIRE(result.transactions_submitted == 3);
        REQUIRE(h.pool->get_identity(0).total_trades == 1);

        auto stats = coordinator.get_stats();
        REQUIRE(stats.total_bundles == 1);
        REQUIRE(stats.successful_bundles == 1);
    }

    SECTION("Explicit tip overrides the configured initial tip") {
        auto coordinator = h.coordinator();
        coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000, std::nullopt, 300000000);
        REQUIRE(h.relay->tips.front() == 300000000);
    }

    SECTION("Cancel ends retries after the current attempt") {
        auto coordinator = h.coordinator();
        coordinator.cancel();
        auto result = coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.attempts == 1);
        REQUIRE(coordinator.cancelled());
    }

    SECTION("Reset after cancel restores full tip escalation") {
        auto coordinator = h.coordinator();
        coordinator.cancel();
        coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);
        coordinator.reset();
        REQUIRE_FALSE(coordinator.cancelled());

        h.relay->tips.clear();
        auto result = coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);
        REQUIRE(result.attempts == 3);
        REQUIRE(h.relay->tips == std::vector<uint64_t>{100000000, 150000000, 200000000});
    }
}

TEST_CASE("Attempt notifications", "[bundle]") {
    Harness h;
    auto coordinator = h.coordinator();
    std::vector<BundleState> states;
    coordinator.set_attempt_listener([&states](const BundleAttempt& a) { states.push_back(a.state); });

    SECTION("Landed on the first attempt") {
        h.relay->succeed_on_attempt = 1;
        coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);
        REQUIRE(states == std::vector<BundleState>{
            BundleState::Building, BundleState::Submitted, BundleState::Landed});
    }

    SECTION("Failed twice with a final failure") {
        CoordinatorConfig cfg;
        cfg.max_retries = 2;
        auto two_tries = h.coordinator(cfg);
        two_tries.set_attempt_listener([&states](const BundleAttempt& a) { states.push_back(a.state); });
        two_tries.execute_buy("So11111111111111111111111111111111111111112", 50000000);

        REQUIRE(states == std::vector<BundleState>{
            BundleState::Building, BundleState::Submitted, BundleState::Failed,
            BundleState::Building, BundleState::Submitted, BundleState::FinalFailure});
    }
}

TEST_CASE("Bundle building", "[bundle]") {
    Harness h;
    auto coordinator = h.coordinator();
    h.relay->succeed_on_attempt = 1;

    SECTION("Identities whose build fails are left out") {
        h.builder->failing.push_back(h.pool->get_identity(1).keypair.pubkey());
        auto result = coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);

        REQUIRE(result.success);
        REQUIRE(result.transactions_submitted == 2);
        REQUIRE(result.identities == std::vector<size_t>{0, 2});
    }

    SECTION("Nothing is submitted when every build fails") {
        for (size_t i = 0; i < 3; i++) {
            h.builder->failing.push_back(h.pool->get_identity(i).keypair.pubkey());
        }
        auto result = coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);

        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message == "No transactions built");
        REQUIRE(h.relay->tips.empty());
    }

    SECTION("Subsets are deduplicated and out of range indices skipped") {
        auto result = coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000,
                                              std::vector<size_t>{2, 0, 2, 7});
        REQUIRE(result.identities == std::vector<size_t>{2, 0});
    }

    SECTION("Every transaction carries the per-identity amount") {
        coordinator.execute_buy("So11111111111111111111111111111111111111112", 50000000);
        REQUIRE(h.builder->amounts() == std::vector<uint64_t>{50000000, 50000000, 50000000});
    }
}

TEST_CASE("Percentage sells", "[bundle]") {
    Harness h;
    auto coordinator = h.coordinator();
    h.relay->succeed_on_attempt = 1;
    h.token_balances[h.owner(0)] = 1000;
    h.token_balances[h.owner(1)] = 333;
    h.token_balances[h.owner(2)] = 0;

    SECTION("Full sell uses the exact balance and skips empty identities") {
        auto result = coordinator.execute_percentage_sell("So11111111111111111111111111111111111111112", 1.0);

        auto amounts = h.builder->amounts();
        std::sort(amounts.begin(), amounts.end());
        REQUIRE(amounts == std::vector<uint64_t>{333, 1000});
        REQUIRE(result.transactions_submitted == 2);
        REQUIRE(h.pool->get_identity(0).token_balance == 1000);
    }

    SECTION("Partial sells round down") {
        coordinator.execute_percentage_sell("So11111111111111111111111111111111111111112", 0.5);

        auto amounts = h.builder->amounts();
        std::sort(amounts.begin(), amounts.end());
        REQUIRE(amounts == std::vector<uint64_t>{166, 500});
    }

    SECTION("Percentages outside (0, 1] are rejected") {
        REQUIRE_THROWS_AS(coordinator.execute_percentage_sell("mint", 0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(coordinator.execute_percentage_sell("mint", 1.5), std::invalid_argument);
        REQUIRE(h.builder->amounts().empty());
    }
}
