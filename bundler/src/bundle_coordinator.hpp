#pragma once

#include "bundle_relay.hpp"
#include "identity_pool.hpp"
#include "instruction_builder.hpp"
#include "resilient_client.hpp"
#include "stop_signal.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class BundleState {
    Building,
    Submitted,
    Landed,
    Failed,
    FinalFailure
};

std::string to_string(BundleState state);

struct BundleAttempt {
    int attempt = 0;
    uint64_t tip = 0;
    size_t transaction_count = 0;
    BundleState state = BundleState::Building;
    std::string bundle_id;
    std::string error;
};

struct BundleResult {
    bool success = false;
    std::string bundle_id;
    std::string error_message;
    uint64_t tip_paid = 0;      // tip of the landed attempt, 0 when nothing landed
    uint64_t last_tip = 0;      // tip offered on the final attempt
    size_t transactions_submitted = 0;
    std::vector<size_t> identities;
    int attempts = 0;

    nlohmann::json to_json() const;
};

struct CoordinatorConfig {
    uint64_t initial_tip = 100000000;
    uint64_t tip_increment = 50000000;
    uint64_t max_tip = 1000000000;
    int max_retries = 3;
    std::chrono::milliseconds retry_delay{1000};
};

struct CoordinatorStats {
    uint64_t total_bundles = 0;
    uint64_t successful_bundles = 0;
    double success_rate = 0.0;
    size_t identity_count = 0;

    nlohmann::json to_json() const;
};

using AttemptListener = std::function<void(const BundleAttempt&)>;

class BundleCoordinator {
public:
    BundleCoordinator(std::shared_ptr<IdentityPool> pool,
                      std::shared_ptr<ResilientClient> client,
                      std::shared_ptr<InstructionBuilder> builder,
                      std::shared_ptr<BundleRelay> relay,
                      const CoordinatorConfig& config = CoordinatorConfig{});

    void set_attempt_listener(AttemptListener listener);

    BundleResult execute_buy(const std::string& target,
                             uint64_t lamports_per_identity,
                             const std::optional<std::vector<size_t>>& subset = std::nullopt,
                             std::optional<uint64_t> tip = std::nullopt);

    // percentage must be in (0, 1]; throws std::invalid_argument otherwise.
    BundleResult execute_percentage_sell(const std::string& target,
                                         double percentage,
                                         const std::optional<std::vector<size_t>>& subset = std::nullopt,
                                         std::optional<uint64_t> tip = std::nullopt);

    // Never throws. Escalates the tip after each failed attempt.
    BundleResult submit_with_retry(const std::vector<Transaction>& transactions,
                                   uint64_t initial_tip,
                                   int max_retries);

    // Cancels any retry delay in progress. Stays in effect, so every later
    // bundle gets a single attempt, until reset() is called.
    void cancel();
    void reset();
    bool cancelled() const { return stop_.stop_requested(); }

    CoordinatorStats get_stats() const;

private:
    struct BuiltTransaction {
        size_t index;
        Transaction tx;
    };
    using BuildFn = std::function<std::optional<BuiltTransaction>(size_t)>;

    std::shared_ptr<IdentityPool> pool_;
    std::shared_ptr<ResilientClient> client_;
    std::shared_ptr<InstructionBuilder> builder_;
    std::shared_ptr<BundleRelay> relay_;
    CoordinatorConfig config_;

    mutable std::mutex listener_mutex_;
    AttemptListener listener_;
    StopSignal stop_;

    std::atomic<uint64_t> total_bundles_{0};
    std::atomic<uint64_t> successful_bundles_{0};

    std::vector<size_t> select_identities(const std::optional<std::vector<size_t>>& subset) const;
    std::vector<BuiltTransaction> build_all(const std::vector<size_t>& indices, const BuildFn& build);
    Transaction build_from_plan(const InstructionPlan& plan, const Keypair& signer);
    BundleResult submit_built(std::vector<BuiltTransaction> built, std::optional<uint64_t> tip);
    void notify(const BundleAttempt& attempt);
};
