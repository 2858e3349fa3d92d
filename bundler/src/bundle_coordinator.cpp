#include "bundle_coordinator.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <future>
#include <stdexcept>

std::string to_string(BundleState state) {
    switch (state) {
        case BundleState::Building: return "building";
        case BundleState::Submitted: return "submitted";
        case BundleState::Landed: return "landed";
        case BundleState::Failed: return "failed";
        case BundleState::FinalFailure: return "final_failure";
    }
    return "unknown";
}

nlohmann::json BundleResult::to_json() const {
    return {
        {"success", success},
        {"bundle_id", bundle_id.empty() ? nlohmann::json(nullptr) : nlohmann::json(bundle_id)},
        {"error_message", error_message.empty() ? nlohmann::json(nullptr) : nlohmann::json(error_message)},
        {"tip_paid", tip_paid},
        {"last_tip", last_tip},
        {"transactions_submitted", transactions_submitted},
        {"identities", identities},
        {"attempts", attempts}
    };
}

nlohmann::json CoordinatorStats::to_json() const {
    return {
        {"total_bundles", total_bundles},
        {"successful_bundles", successful_bundles},
        {"success_rate", success_rate},
        {"identity_count", identity_count}
    };
}

BundleCoordinator::BundleCoordinator(std::shared_ptr<IdentityPool> pool,
                                     std::shared_ptr<ResilientClient> client,
                                     std::shared_ptr<InstructionBuilder> builder,
                                     std::shared_ptr<BundleRelay> relay,
                                     const CoordinatorConfig& config)
    : pool_(std::move(pool))
    , client_(std::move(client))
    , builder_(std::move(builder))
    , relay_(std::move(relay))
    , config_(config)
{
    if (!pool_ || !client_ || !builder_ || !relay_) {
        throw std::invalid_argument("BundleCoordinator requires pool, client, builder and relay");
    }
}

void BundleCoordinator::set_attempt_listener(AttemptListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void BundleCoordinator::notify(const BundleAttempt& attempt) {
    spdlog::debug("Bundle attempt {} tip={} -> {}", attempt.attempt, attempt.tip, to_string(attempt.state));

    AttemptListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (!listener) return;
    try {
        listener(attempt);
    } catch (const std::exception& e) {
        spdlog::warn("Bundle attempt listener failed: {}", e.what());
    }
}

void BundleCoordinator::cancel() {
    stop_.request_stop();
    spdlog::info("Bundle retries cancelled");
}

void BundleCoordinator::reset() {
    stop_.reset();
}

std::vector<size_t> BundleCoordinator::select_identities(const std::optional<std::vector<size_t>>& subset) const {
    size_t count = pool_->get_count();
    std::vector<size_t> indices;

    if (!subset) {
        for (size_t i = 0; i < count; ++i) indices.push_back(i);
        return indices;
    }

    for (size_t i : *subset) {
        if (i >= count) {
            spdlog::warn("Skipping identity {}: pool has {} identities", i, count);
            continue;
        }
        if (std::find(indices.begin(), indices.end(), i) == indices.end()) {
            indices.push_back(i);
        }
    }
    return indices;
}

Transaction BundleCoordinator::build_from_plan(const InstructionPlan& plan, const Keypair& signer) {
    ComputeBudget budget;
    budget.compute_unit_limit = plan.compute_unit_limit;
    budget.priority_fee = plan.priority_fee;
    return client_->build_transaction(plan.instructions, signer, budget);
}

std::vector<BundleCoordinator::BuiltTransaction>
BundleCoordinator::build_all(const std::vector<size_t>& indices, const BuildFn& build) {
    std::vector<std::future<std::optional<BuiltTransaction>>> pending;
    pending.reserve(indices.size());
    for (size_t index : indices) {
        pending.push_back(std::async(std::launch::async, [&build, index]() -> std::optional<BuiltTransaction> {
            try {
                return build(index);
            } catch (const std::exception& e) {
                spdlog::warn("Skipping identity {}: {}", index, e.what());
                return std::nullopt;
            }
        }));
    }

    // Every build finishes or is skipped before anything is submitted.
    std::vector<BuiltTransaction> built;
    for (auto& f : pending) {
        auto result = f.get();
        if (result) {
            built.push_back(std::move(*result));
        }
    }
    return built;
}

BundleResult BundleCoordinator::submit_built(std::vector<BuiltTransaction> built, std::optional<uint64_t> tip) {
    if (built.empty()) {
        BundleResult result;
        result.error_message = "No transactions built";
        spdlog::error("Bundle aborted: no transactions built");
        return result;
    }

    std::vector<Transaction> transactions;
    std::vector<size_t> identities;
    for (auto& b : built) {
        identities.push_back(b.index);
        transactions.push_back(std::move(b.tx));
    }

    total_bundles_++;
    auto result = submit_with_retry(transactions, tip.value_or(config_.initial_tip), config_.max_retries);
    result.identities = identities;

    if (result.success) {
        successful_bundles_++;
        for (size_t i : identities) {
            pool_->record_use(i);
        }
    }
    return result;
}

BundleResult BundleCoordinator::execute_buy(const std::string& target,
                                            uint64_t lamports_per_identity,
                                            const std::optional<std::vector<size_t>>& subset,
                                            std::optional<uint64_t> tip) {
    auto indices = select_identities(subset);
    spdlog::info("Bundled buy of {} across {} identities ({:.4f} SOL each)",
                 target, indices.size(), util::lamports_to_sol(lamports_per_identity));

    auto built = build_all(indices, [&](size_t index) -> std::optional<BuiltTransaction> {
        Identity identity = pool_->get_identity(index);
        auto plan = builder_->build_buy(target, identity.keypair.pubkey(), lamports_per_identity);
        return BuiltTransaction{index, build_from_plan(plan, identity.keypair)};
    });

    return submit_built(std::move(built), tip);
}

BundleResult BundleCoordinator::execute_percentage_sell(const std::string& target,
                                                        double percentage,
                                                        const std::optional<std::vector<size_t>>& subset,
                                                        std::optional<uint64_t> tip) {
    if (!(percentage > 0.0 && percentage <= 1.0)) {
        throw std::invalid_argument("sell percentage must be in (0, 1]");
    }

    auto indices = select_identities(subset);
    spdlog::info("Bundled sell of {:.1f}% of {} across {} identities", percentage * 100.0, target, indices.size());

    auto built = build_all(indices, [&](size_t index) -> std::optional<BuiltTransaction> {
        Identity identity = pool_->get_identity(index);
        uint64_t balance = client_->get_token_balance(identity.keypair.pubkey().to_string(), target);
        pool_->set_token_balance(index, balance);

        uint64_t amount = balance;
        if (percentage < 1.0) {
            long double scaled = std::floor(static_cast<long double>(balance) * percentage);
            amount = std::min(balance, static_cast<uint64_t>(scaled));
        }
        if (amount == 0) {
            spdlog::info("Identity {} has nothing to sell", index);
            return std::nullopt;
        }

        auto plan = builder_->build_sell(target, identity.keypair.pubkey(), amount);
        return BuiltTransaction{index, build_from_plan(plan, identity.keypair)};
    });

    return submit_built(std::move(built), tip);
}

BundleResult BundleCoordinator::submit_with_retry(const std::vector<Transaction>& transactions,
                                                  uint64_t initial_tip,
                                                  int max_retries) {
    BundleResult result;
    if (transactions.empty()) {
        result.error_message = "No transactions built";
        return result;
    }
    if (max_retries < 1) {
        max_retries = 1;
    }

    uint64_t tip = initial_tip;
    for (int attempt = 1; attempt <= max_retries; ++attempt) {
        BundleAttempt state;
        state.attempt = attempt;
        state.tip = tip;
        state.transaction_count = transactions.size();
        notify(state);

        state.state = BundleState::Submitted;
        notify(state);

        RelaySubmission sub;
        try {
            sub = relay_->submit(transactions, tip);
        } catch (const std::exception& e) {
            sub.success = false;
            sub.error_message = e.what();
        }

        result.attempts = attempt;
        result.last_tip = tip;
        result.transactions_submitted = transactions.size();

        if (sub.success) {
            state.state = BundleState::Landed;
            state.bundle_id = sub.bundle_id;
            notify(state);

            result.success = true;
            result.bundle_id = sub.bundle_id;
            result.error_message.clear();
            result.tip_paid = tip;
            spdlog::info("Bundle {} landed on attempt {} with tip {:.4f} SOL",
                         sub.bundle_id, attempt, util::lamports_to_sol(tip));
            return result;
        }

        result.error_message = sub.error_message;
        state.error = sub.error_message;

        if (attempt == max_retries) {
            state.state = BundleState::FinalFailure;
            notify(state);
            break;
        }

        state.state = BundleState::Failed;
        notify(state);

        tip = std::min(tip + config_.tip_increment, config_.max_tip);
        spdlog::warn("Bundle attempt {}/{} failed: {}. Retrying with tip {:.4f} SOL",
                     attempt, max_retries, sub.error_message, util::lamports_to_sol(tip));

        if (stop_.wait_for(config_.retry_delay)) {
            spdlog::info("Bundle retries cancelled");
            break;
        }
    }

    spdlog::error("Bundle failed after {} attempts: {}", result.attempts, result.error_message);
    return result;
}

CoordinatorStats BundleCoordinator::get_stats() const {
    CoordinatorStats stats;
    stats.total_bundles = total_bundles_.load();
    stats.successful_bundles = successful_bundles_.load();
    stats.success_rate = stats.total_bundles > 0
        ? static_cast<double>(stats.successful_bundles) / static_cast<double>(stats.total_bundles)
        : 0.0;
    stats.identity_count = pool_->get_count();
    return stats;
}
