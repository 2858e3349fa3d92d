#pragma once

#include "blockhash_cache.hpp"
#include "failover_router.hpp"
#include "http_client.hpp"
#include "keypair.hpp"
#include "solana_rpc.hpp"
#include "solana_types.hpp"
#include "stop_signal.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

constexpr uint32_t DEFAULT_COMPUTE_UNIT_LIMIT = 85000;

struct ComputeBudget {
    std::optional<uint64_t> priority_fee;           // micro-lamports per compute unit
    std::optional<uint32_t> compute_unit_limit;
    std::optional<uint32_t> account_data_size_limit;

    bool any() const { return priority_fee || compute_unit_limit || account_data_size_limit; }
};

struct ClientConfig {
    int rpc_timeout_ms = 10000;
    int health_timeout_ms = 5000;
    int send_max_retries = 3;
    std::chrono::milliseconds send_backoff_base{1000};
    std::chrono::milliseconds confirm_poll_interval{1000};
    std::chrono::milliseconds blockhash_refresh_interval{5000};
    std::chrono::milliseconds blockhash_max_age{60000};
};

// One API over either a single endpoint or a FailoverRouter. The mode is
// fixed by the constructor used.
class ResilientClient {
public:
    ResilientClient(const std::string& endpoint,
                    std::shared_ptr<HttpClient> http,
                    const ClientConfig& config = ClientConfig{});
    explicit ResilientClient(std::shared_ptr<FailoverRouter> router,
                             const ClientConfig& config = ClientConfig{});
    ~ResilientClient();

    ResilientClient(const ResilientClient&) = delete;
    ResilientClient& operator=(const ResilientClient&) = delete;

    void start();
    // Stops background refresh and wakes send backoffs and confirmation
    // polls in progress. The client stays usable.
    void stop();

    bool failover_enabled() const { return router_ != nullptr; }
    std::shared_ptr<FailoverRouter> router() const { return router_; }
    std::string endpoint() const;

    std::string get_cached_blockhash();

    // Budget instructions first (data size limit, unit limit, unit price),
    // then the caller's instructions unchanged.
    static std::vector<Instruction> with_compute_budget(const std::vector<Instruction>& instructions,
                                                        const ComputeBudget& budget);

    // Throws TransactionBuildError.
    Transaction build_transaction(const std::vector<Instruction>& instructions,
                                  const Keypair& signer,
                                  const ComputeBudget& budget = ComputeBudget{});

    // Single attempt in single mode, provider failover in failover mode.
    std::string send_transaction(const Transaction& tx, bool skip_preflight = false);

    // Throws TransactionBuildError without retrying, TransactionSubmitError
    // once every send attempt failed. max_retries <= 0 uses the configured default.
    std::string build_and_send_transaction(const std::vector<Instruction>& instructions,
                                           const Keypair& signer,
                                           const ComputeBudget& budget = ComputeBudget{},
                                           bool skip_preflight = false,
                                           int max_retries = 0);

    // False on an on-chain error, an RPC failure, stop() or max_wait elapsing.
    bool confirm_transaction(const std::string& signature,
                             const std::string& commitment = "confirmed",
                             std::chrono::milliseconds max_wait = std::chrono::milliseconds(0));

    std::optional<nlohmann::json> post_rpc(const nlohmann::json& body);

    uint64_t get_balance(const std::string& address);
    std::optional<nlohmann::json> get_account_info(const std::string& address);
    std::vector<std::optional<nlohmann::json>> get_multiple_accounts(const std::vector<std::string>& addresses);
    uint64_t get_token_account_balance(const std::string& token_account);
    // Sum over every token account the owner holds for the mint.
    uint64_t get_token_balance(const std::string& owner, const std::string& mint);
    bool get_health();

private:
    ClientConfig config_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<FailoverRouter> router_;
    std::unique_ptr<SolanaRpc> rpc_;
    std::unique_ptr<BlockhashCache> blockhash_;
    StopSignal stop_;

    template <typename Op>
    auto run(Op&& op) -> decltype(op(std::declval<SolanaRpc&>())) {
        if (router_) {
            return router_->execute_with_failover(std::forward<Op>(op));
        }
        return op(*rpc_);
    }
};

// Failover mode for more than one endpoint, single mode otherwise.
// Throws ConstructionError when endpoints is empty.
std::shared_ptr<ResilientClient> make_client(const std::vector<std::string>& endpoints,
                                             std::shared_ptr<HttpClient> http,
                                             const RouterConfig& router_config = RouterConfig{},
                                             const ClientConfig& client_config = ClientConfig{});
