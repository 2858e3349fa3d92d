#include <catch2/catch_test_macros.hpp>
#include "../src/identity_pool.hpp"
#include "../src/util.hpp"
#include "fake_http.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace {

// Balances by address; unknown addresses hold nothing.
struct Ledger {
    std::mutex mutex;
    std::map<std::string, uint64_t> balances;

    void set(const std::string& address, uint64_t lamports) {
        std::lock_guard<std::mutex> lock(mutex);
        balances[address] = lamports;
    }

    FakeHttp::Handler handler() {
        return [this](const std::string&, const nlohmann::json& req) {
            std::string address = req["params"][0].get<std::string>();
            uint64_t lamports = 0;
            {
                std::lock_guard<std::mutex> lock(mutex);
                auto it = balances.find(address);
                if (it != balances.end()) lamports = it->second;
            }
            return HttpResponse{200, FakeHttp::rpc_result({{"context", {{"slot", 1}}}, {"value", lamports}})};
        };
    }
};

std::string temp_store(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("solbundle_" + name + ".json");
    std::filesystem::remove(path);
    return path.string();
}

PoolConfig small_pool(const std::string& path) {
    PoolConfig cfg;
    cfg.num_identities = 3;
    cfg.min_balance = 100000000;
    cfg.target_balance = 1000000000;
    cfg.storage_path = path;
    cfg.transfer_delay = std::chrono::milliseconds(0);
    return cfg;
}

}

TEST_CASE("Identity pool initialization", "[pool]") {
    auto http = std::make_shared<FakeHttp>();
    Ledger ledger;
    script_blockhash(*http);
    http->on("getBalance", ledger.handler());
    http->on("sendTransaction", FakeHttp::result("5sig"));

    auto client = std::make_shared<ResilientClient>("https://rpc", http);
    auto funding = Keypair::generate();

    SECTION("Generated identities are persisted and topped up") {
        auto path = temp_store("generate");
        ledger.set(funding.pubkey().to_string(), 10 * util::LAMPORTS_PER_SOL);

        IdentityPool pool(client, small_pool(path));
        pool.initialize(funding);

        REQUIRE(pool.initialized());
        REQUIRE(pool.get_count() == 3);
        REQUIRE(http->calls("sendTransaction") == 3);
        for (size_t i = 0; i < 3; i++) {
            REQUIRE(pool.get_identity(i).balance_lamports == 1000000000);
        }

        IdentityPool reloaded(client, small_pool(path));
        auto identities = reloaded.load();
        REQUIRE(identities.size() == 3);
        REQUIRE(identities[0].keypair.pubkey() == pool.get_identity(0).keypair.pubkey());
        REQUIRE(identities[2].balance_lamports == 1000000000);
    }

    SECTION("Funding is skipped when the funding identity cannot cover it") {
        auto path = temp_store("insufficient");
        ledger.set(funding.pubkey().to_string(), util::LAMPORTS_PER_SOL);

        IdentityPool pool(client, small_pool(path));
        pool.initialize(funding);

        REQUIRE(pool.get_count() == 3);
        REQUIRE(http->calls("sendTransaction") == 0);
        REQUIRE(pool.get_stats().total_balance == 0);
    }

    SECTION("Stored identities are reused and the pool is filled up") {
        auto path = temp_store("reuse");
        auto a = Keypair::generate();
        auto b = Keypair::generate();
        {
            std::ofstream out(path);
            out << nlohmann::json{{"identities", {
                {{"key_material", a.secret_base58()}, {"balance_sol", 0.5}, {"balance_tokens", 0},
                 {"total_trades", 4}, {"last_used", nullptr}},
                {{"key_material", b.secret_base58()}, {"balance_sol", 0.5}, {"balance_tokens", 0},
                 {"total_trades", 0}, {"last_used", nullptr}}
            }}}.dump();
        }
        ledger.set(a.pubkey().to_string(), 500000000);
        ledger.set(b.pubkey().to_string(), 500000000);

        IdentityPool pool(client, small_pool(path));
        pool.initialize(funding);

        REQUIRE(pool.get_count() == 3);
        REQUIRE(pool.get_identity(0).keypair.pubkey() == a.pubkey());
        REQUIRE(pool.get_identity(1).keypair.pubkey() == b.pubkey());
        REQUIRE(pool.get_identity(0).total_trades == 4);
        REQUIRE(pool.get_identity(1).balance_lamports == 500000000);
    }

    SECTION("Unreadable storage is kept aside and replaced with fresh identities") {
        auto path = temp_store("corrupt");
        std::filesystem::remove(path + ".corrupt");
        {
            std::ofstream out(path);
            out << "{not json";
        }

        IdentityPool pool(client, small_pool(path));
        pool.initialize(funding);
        REQUIRE(pool.get_count() == 3);
        REQUIRE(pool.load().size() == 3);

        std::ifstream kept(path + ".corrupt");
        std::string contents((std::istreambuf_iterator<char>(kept)), std::istreambuf_iterator<char>());
        REQUIRE(contents == "{not json");
    }

    SECTION("A bad entry is skipped without losing the funded keys") {
        auto path = temp_store("partial");
        std::filesystem::remove(path + ".corrupt");
        auto a = Keypair::generate();
        auto b = Keypair::generate();
        {
            std::ofstream out(path);
            out << nlohmann::json{{"identities", {
                {{"key_material", a.secret_base58()}, {"balance_sol", 0.5}},
                {{"key_material", "0OIl-not-base58"}, {"balance_sol", 0.5}},
                {{"key_material", b.secret_base58()}, {"balance_sol", 0.5}}
            }}}.dump();
        }
        ledger.set(a.pubkey().to_string(), 500000000);
        ledger.set(b.pubkey().to_string(), 500000000);

        IdentityPool pool(client, small_pool(path));
        pool.initialize(funding);

        REQUIRE(pool.get_count() == 3);
        REQUIRE(pool.get_identity(0).keypair.pubkey() == a.pubkey());
        REQUIRE(pool.get_identity(1).keypair.pubkey() == b.pubkey());

        size_t skipped = 0;
        auto stored = pool.load(&skipped);
        REQUIRE(skipped == 0);
        REQUIRE(stored.size() == 3);
        REQUIRE(stored[0].keypair.pubkey() == a.pubkey());
        REQUIRE(stored[1].keypair.pubkey() == b.pubkey());
        REQUIRE(std::filesystem::exists(path + ".corrupt"));
    }
}

TEST_CASE("Identity pool operations", "[pool]") {
    auto http = std::make_shared<FakeHttp>();
    Ledger ledger;
    script_blockhash(*http);
    http->on("getBalance", ledger.handler());
    http->on("sendTransaction", FakeHttp::result("5sig"));

    auto client = std::make_shared<ResilientClient>("https://rpc", http);
    auto funding = Keypair::generate();
    auto path = temp_store("operations");

    IdentityPool pool(client, small_pool(path));
    pool.initialize(funding);
    REQUIRE(http->calls("sendTransaction") == 0);

    SECTION("Rebalance splits the shortfall across identities under target") {
        ledger.set(pool.get_identity(0).keypair.pubkey().to_string(), 1500000000);
        ledger.set(pool.get_identity(1).keypair.pubkey().to_string(), 200000000);
        ledger.set(pool.get_identity(2).keypair.pubkey().to_string(), 300000000);

        REQUIRE(pool.rebalance() == 2);
        REQUIRE(pool.get_identity(0).balance_lamports == 1500000000);
        REQUIRE(pool.get_identity(1).balance_lamports == 700000000);
        REQUIRE(pool.get_identity(2).balance_lamports == 800000000);
    }

    SECTION("Balanced pool needs no transfers") {
        for (size_t i = 0; i < 3; i++) {
            ledger.set(pool.get_identity(i).keypair.pubkey().to_string(), 1000000000);
        }
        REQUIRE(pool.rebalance() == 0);
        REQUIRE(http->calls("sendTransaction") == 0);
    }

    SECTION("Usage and stats") {
        pool.record_use(1);
        pool.record_use(1);
        pool.set_token_balance(2, 42);

        REQUIRE(pool.get_identity(1).total_trades == 2);
        REQUIRE(pool.get_identity(1).last_used_ms > 0);
        REQUIRE(pool.get_identity(2).token_balance == 42);
        REQUIRE(pool.get_stats().total_trades == 2);
    }

    SECTION("Out of range lookups throw") {
        REQUIRE_THROWS_AS(pool.get_identity(3), std::out_of_range);
    }

    SECTION("Second initialization is ignored") {
        auto first = pool.get_identity(0).keypair.pubkey();
        pool.initialize(Keypair::generate());
        REQUIRE(pool.get_identity(0).keypair.pubkey() == first);
    }
}
