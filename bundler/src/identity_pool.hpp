#pragma once

#include "keypair.hpp"
#include "resilient_client.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct Identity {
    Keypair keypair;
    uint64_t balance_lamports = 0;
    uint64_t token_balance = 0;
    uint64_t total_trades = 0;
    int64_t last_used_ms = 0;   // 0 when never used
};

struct PoolConfig {
    size_t num_identities = 20;
    uint64_t min_balance = 100000000;       // 0.1 SOL
    uint64_t target_balance = 1000000000;   // 1.0 SOL
    uint64_t fee_margin = 10000000;         // 0.01 SOL
    std::string storage_path;               // empty disables persistence
    std::chrono::milliseconds transfer_delay{100};
};

struct PoolStats {
    size_t num_identities = 0;
    uint64_t total_balance = 0;
    uint64_t average_balance = 0;
    uint64_t min_balance = 0;
    uint64_t max_balance = 0;
    uint64_t total_trades = 0;

    nlohmann::json to_json() const;
};

class IdentityPool {
public:
    IdentityPool(std::shared_ptr<ResilientClient> client, const PoolConfig& config = PoolConfig{});

    // Loads or generates identities, persists them, then tops up any below
    // the minimum balance when the funding identity can cover it.
    void initialize(const Keypair& funding);
    bool initialized() const;

    // Transfer from the funding identity. Failures are logged and return false.
    bool fund(size_t index, uint64_t lamports);

    // Splits the shortfall against target * N evenly across identities below
    // target. Returns the number of successful transfers.
    size_t rebalance();

    // Throws std::out_of_range.
    Identity get_identity(size_t index) const;
    size_t get_count() const;
    std::vector<uint64_t> get_all_balances();
    void refresh_balances();

    void record_use(size_t index);
    void set_token_balance(size_t index, uint64_t amount);
    PoolStats get_stats() const;

    void save() const;
    // Entries that fail to decode are skipped and counted in skipped.
    // Throws when the file cannot be read or is not a pool document.
    std::vector<Identity> load(size_t* skipped = nullptr) const;

private:
    std::shared_ptr<ResilientClient> client_;
    PoolConfig config_;

    mutable std::mutex mutex_;
    std::vector<Identity> identities_;
    std::optional<Keypair> funding_;
    bool initialized_ = false;

    void load_or_generate();
    // Renames the storage file to <path>.corrupt. Throws if it cannot.
    void preserve_damaged_storage() const;
    void fund_below_minimum();
};
