#include "identity_pool.hpp"
#include "instructions.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

nlohmann::json PoolStats::to_json() const {
    return {
        {"num_identities", num_identities},
        {"total_balance_sol", util::lamports_to_sol(total_balance)},
        {"average_balance_sol", util::lamports_to_sol(average_balance)},
        {"min_balance_sol", util::lamports_to_sol(min_balance)},
        {"max_balance_sol", util::lamports_to_sol(max_balance)},
        {"total_trades", total_trades}
    };
}

IdentityPool::IdentityPool(std::shared_ptr<ResilientClient> client, const PoolConfig& config)
    : client_(std::move(client))
    , config_(config)
{
    if (!client_) {
        throw std::invalid_argument("IdentityPool requires a client");
    }
}

void IdentityPool::initialize(const Keypair& funding) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) {
            spdlog::warn("Identity pool already initialized");
            return;
        }
        funding_ = funding;
    }

    spdlog::info("Initializing identity pool with {} identities", config_.num_identities);
    load_or_generate();
    refresh_balances();
    fund_below_minimum();

    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = true;
    spdlog::info("Identity pool ready: {} identities", identities_.size());
}

bool IdentityPool::initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void IdentityPool::load_or_generate() {
    std::vector<Identity> loaded;
    bool damaged = false;
    if (!config_.storage_path.empty()) {
        std::ifstream existing(config_.storage_path);
        if (existing.good()) {
            existing.close();
            size_t skipped = 0;
            try {
                loaded = load(&skipped);
                spdlog::info("Loaded {} identities from {}", loaded.size(), config_.storage_path);
                damaged = skipped > 0;
            } catch (const std::exception& e) {
                spdlog::error("Failed to load identities from {}: {}", config_.storage_path, e.what());
                loaded.clear();
                damaged = true;
            }
        }
    }

    // The damaged file still holds keys; move it aside before save() replaces it.
    if (damaged) {
        preserve_damaged_storage();
    }

    size_t generated = 0;
    while (loaded.size() < config_.num_identities) {
        Identity id{Keypair::generate()};
        loaded.push_back(std::move(id));
        generated++;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        identities_ = std::move(loaded);
    }

    if (generated > 0) {
        spdlog::info("Generated {} new identities", generated);
    }
    if (generated > 0 || damaged) {
        save();
    }
}

void IdentityPool::preserve_damaged_storage() const {
    std::string backup = config_.storage_path + ".corrupt";
    if (std::filesystem::exists(backup)) {
        backup += "." + std::to_string(util::current_timestamp_ms());
    }
    std::error_code ec;
    std::filesystem::rename(config_.storage_path, backup, ec);
    if (ec) {
        throw std::runtime_error("Cannot preserve damaged identity file " + config_.storage_path +
                                 ": " + ec.message());
    }
    spdlog::warn("Damaged identity file kept as {}", backup);
}

void IdentityPool::fund_below_minimum() {
    std::vector<std::pair<size_t, uint64_t>> needs;
    uint64_t total_needed = 0;
    Pubkey funding_key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        funding_key = funding_->pubkey();
        for (size_t i = 0; i < identities_.size(); ++i) {
            const auto& id = identities_[i];
            if (id.balance_lamports < config_.min_balance) {
                uint64_t need = config_.target_balance - std::min(id.balance_lamports, config_.target_balance);
                if (need > 0) {
                    needs.emplace_back(i, need);
                    total_needed += need;
                }
            }
        }
    }

    if (needs.empty()) {
        spdlog::info("All identities above minimum balance");
        return;
    }

    uint64_t available = 0;
    try {
        available = client_->get_balance(funding_key.to_string());
    } catch (const std::exception& e) {
        spdlog::warn("Could not read funding balance, skipping funding: {}", e.what());
        return;
    }

    if (available < total_needed + config_.fee_margin) {
        spdlog::warn("Insufficient funding balance: need {:.4f} SOL, have {:.4f} SOL. Skipping funding.",
                     util::lamports_to_sol(total_needed + config_.fee_margin),
                     util::lamports_to_sol(available));
        return;
    }

    spdlog::info("Funding {} identities with {:.4f} SOL total", needs.size(), util::lamports_to_sol(total_needed));
    for (size_t n = 0; n < needs.size(); ++n) {
        fund(needs[n].first, needs[n].second);
        if (n + 1 < needs.size()) {
            std::this_thread::sleep_for(config_.transfer_delay);
        }
    }
}

bool IdentityPool::fund(size_t index, uint64_t lamports) {
    std::optional<Keypair> funding;
    Pubkey destination;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!funding_) {
            spdlog::error("Cannot fund identity {}: no funding identity", index);
            return false;
        }
        if (index >= identities_.size()) {
            spdlog::error("Cannot fund identity {}: index out of range", index);
            return false;
        }
        funding = funding_;
        destination = identities_[index].keypair.pubkey();
    }

    try {
        auto ix = instructions::system_transfer(funding->pubkey(), destination, lamports);
        auto signature = client_->build_and_send_transaction({ix}, *funding);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            identities_[index].balance_lamports += lamports;
        }
        spdlog::info("Funded identity {} with {:.4f} SOL: {}", index, util::lamports_to_sol(lamports), signature);
        save();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to fund identity {}: {}", index, e.what());
        return false;
    }
}

size_t IdentityPool::rebalance() {
    refresh_balances();

    std::vector<size_t> under_target;
    uint64_t total = 0;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count = identities_.size();
        for (size_t i = 0; i < identities_.size(); ++i) {
            total += identities_[i].balance_lamports;
            if (identities_[i].balance_lamports < config_.target_balance) {
                under_target.push_back(i);
            }
        }
    }

    uint64_t target_total = config_.target_balance * count;
    if (total >= target_total || under_target.empty()) {
        spdlog::info("Identity pool balanced ({:.4f} SOL)", util::lamports_to_sol(total));
        return 0;
    }

    uint64_t needed = target_total - total;
    uint64_t per_identity = needed / under_target.size();
    if (per_identity == 0) {
        return 0;
    }

    spdlog::info("Rebalancing: {:.4f} SOL across {} identities",
                 util::lamports_to_sol(needed), under_target.size());

    size_t funded = 0;
    for (size_t n = 0; n < under_target.size(); ++n) {
        if (fund(under_target[n], per_identity)) {
            funded++;
        }
        if (n + 1 < under_target.size()) {
            std::this_thread::sleep_for(config_.transfer_delay);
        }
    }
    return funded;
}

Identity IdentityPool::get_identity(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= identities_.size()) {
        throw std::out_of_range("identity index " + std::to_string(index) + " out of range");
    }
    return identities_[index];
}

size_t IdentityPool::get_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return identities_.size();
}

void IdentityPool::refresh_balances() {
    std::vector<std::string> addresses;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : identities_) {
            addresses.push_back(id.keypair.pubkey().to_string());
        }
    }

    for (size_t i = 0; i < addresses.size(); ++i) {
        try {
            uint64_t balance = client_->get_balance(addresses[i]);
            std::lock_guard<std::mutex> lock(mutex_);
            identities_[i].balance_lamports = balance;
        } catch (const std::exception& e) {
            spdlog::warn("Failed to read balance of identity {}: {}", i, e.what());
        }
    }
}

std::vector<uint64_t> IdentityPool::get_all_balances() {
    refresh_balances();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint64_t> balances;
    for (const auto& id : identities_) {
        balances.push_back(id.balance_lamports);
    }
    return balances;
}

void IdentityPool::record_use(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& id = identities_.at(index);
    id.total_trades++;
    id.last_used_ms = util::current_timestamp_ms();
}

void IdentityPool::set_token_balance(size_t index, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    identities_.at(index).token_balance = amount;
}

PoolStats IdentityPool::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats stats;
    stats.num_identities = identities_.size();
    if (identities_.empty()) {
        return stats;
    }

    stats.min_balance = identities_.front().balance_lamports;
    for (const auto& id : identities_) {
        stats.total_balance += id.balance_lamports;
        stats.total_trades += id.total_trades;
        stats.min_balance = std::min(stats.min_balance, id.balance_lamports);
        stats.max_balance = std::max(stats.max_balance, id.balance_lamports);
    }
    stats.average_balance = stats.total_balance / identities_.size();
    return stats;
}

void IdentityPool::save() const {
    if (config_.storage_path.empty()) {
        return;
    }

    nlohmann::json entries = nlohmann::json::array();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : identities_) {
            entries.push_back({
                {"key_material", id.keypair.secret_base58()},
                {"balance_sol", util::lamports_to_sol(id.balance_lamports)},
                {"balance_tokens", id.token_balance},
                {"total_trades", id.total_trades},
                {"last_used", id.last_used_ms > 0 ? nlohmann::json(id.last_used_ms) : nlohmann::json(nullptr)}
            });
        }
    }

    const std::string tmp_path = config_.storage_path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot write identity pool to {}", tmp_path);
            return;
        }
        out << nlohmann::json{{"identities", entries}}.dump(2);
    }
    if (std::rename(tmp_path.c_str(), config_.storage_path.c_str()) != 0) {
        spdlog::error("Failed to replace identity pool file {}", config_.storage_path);
        return;
    }
    spdlog::debug("Saved {} identities to {}", entries.size(), config_.storage_path);
}

std::vector<Identity> IdentityPool::load(size_t* skipped) const {
    std::ifstream in(config_.storage_path);
    if (!in) {
        throw std::runtime_error("Cannot open " + config_.storage_path);
    }

    auto data = nlohmann::json::parse(in);
    std::vector<Identity> identities;
    size_t bad = 0;
    const auto& entries = data.at("identities");
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        try {
            Identity id{Keypair::from_base58(entry.at("key_material").get<std::string>())};
            id.balance_lamports = util::sol_to_lamports(entry.value("balance_sol", 0.0));
            id.token_balance = entry.value("balance_tokens", uint64_t{0});
            id.total_trades = entry.value("total_trades", uint64_t{0});
            if (entry.contains("last_used") && entry["last_used"].is_number()) {
                id.last_used_ms = entry["last_used"].get<int64_t>();
            }
            identities.push_back(std::move(id));
        } catch (const std::exception& e) {
            spdlog::warn("Skipping identity entry {} in {}: {}", i, config_.storage_path, e.what());
            bad++;
        }
    }
    if (skipped) {
        *skipped = bad;
    }
    return identities;
}
