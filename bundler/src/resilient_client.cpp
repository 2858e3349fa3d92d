#include "resilient_client.hpp"
#include "errors.hpp"
#include "instructions.hpp"
#include <spdlog/spdlog.h>

ResilientClient::ResilientClient(const std::string& endpoint,
                                 std::shared_ptr<HttpClient> http,
                                 const ClientConfig& config)
    : config_(config)
    , http_(http)
{
    if (!http_) {
        throw ConstructionError("ResilientClient requires an HTTP client");
    }
    rpc_ = std::make_unique<SolanaRpc>(endpoint, std::move(http), config_.rpc_timeout_ms);
    blockhash_ = std::make_unique<BlockhashCache>(
        [this]() { return rpc_->get_latest_blockhash().blockhash; }, config_.blockhash_max_age);
    spdlog::info("ResilientClient using single endpoint {}", endpoint);
}

ResilientClient::ResilientClient(std::shared_ptr<FailoverRouter> router, const ClientConfig& config)
    : config_(config)
    , router_(std::move(router))
{
    if (!router_) {
        throw ConstructionError("ResilientClient requires a router in failover mode");
    }
    spdlog::info("ResilientClient using failover across {} providers", router_->provider_count());
}

ResilientClient::~ResilientClient() {
    stop();
}

void ResilientClient::start() {
    if (router_) {
        router_->start();
    } else {
        blockhash_->start(config_.blockhash_refresh_interval);
    }
}

void ResilientClient::stop() {
    stop_.interrupt();
    if (router_) {
        router_->stop();
    } else if (blockhash_) {
        blockhash_->stop();
        http_->close_idle(rpc_->url());
    }
}

std::string ResilientClient::endpoint() const {
    return router_ ? router_->current_provider() : rpc_->url();
}

std::string ResilientClient::get_cached_blockhash() {
    return router_ ? router_->get_cached_blockhash() : blockhash_->get();
}

std::vector<Instruction> ResilientClient::with_compute_budget(const std::vector<Instruction>& instructions,
                                                              const ComputeBudget& budget) {
    std::vector<Instruction> out;
    if (budget.any()) {
        if (budget.account_data_size_limit) {
            out.push_back(instructions::set_loaded_accounts_data_size_limit(*budget.account_data_size_limit));
        }
        out.push_back(instructions::set_compute_unit_limit(
            budget.compute_unit_limit.value_or(DEFAULT_COMPUTE_UNIT_LIMIT)));
        if (budget.priority_fee) {
            out.push_back(instructions::set_compute_unit_price(*budget.priority_fee));
        }
    }
    out.insert(out.end(), instructions.begin(), instructions.end());
    return out;
}

Transaction ResilientClient::build_transaction(const std::vector<Instruction>& instructions,
                                               const Keypair& signer,
                                               const ComputeBudget& budget) {
    std::string blockhash;
    try {
        blockhash = get_cached_blockhash();
    } catch (const std::exception& e) {
        throw TransactionBuildError(std::string("Failed to get blockhash: ") + e.what());
    }

    try {
        auto tx = Transaction::create(with_compute_budget(instructions, budget), signer.pubkey(), blockhash);
        tx.sign(signer);
        return tx;
    } catch (const std::exception& e) {
        throw TransactionBuildError(std::string("Failed to build transaction: ") + e.what());
    }
}

std::string ResilientClient::send_transaction(const Transaction& tx, bool skip_preflight) {
    const std::string encoded = tx.to_base64();
    if (router_) {
        return router_->send_transaction(encoded, skip_preflight);
    }
    return rpc_->send_transaction(encoded, skip_preflight);
}

std::string ResilientClient::build_and_send_transaction(const std::vector<Instruction>& instructions,
                                                        const Keypair& signer,
                                                        const ComputeBudget& budget,
                                                        bool skip_preflight,
                                                        int max_retries) {
    if (max_retries <= 0) {
        max_retries = config_.send_max_retries;
    }

    Transaction tx = build_transaction(instructions, signer, budget);

    std::string last_error;
    int attempts = 0;
    for (int attempt = 0; attempt < max_retries; ++attempt) {
        attempts++;
        try {
            auto signature = send_transaction(tx, skip_preflight);
            spdlog::info("Transaction sent: {}", signature);
            return signature;
        } catch (const std::exception& e) {
            last_error = e.what();
            spdlog::warn("Send attempt {}/{} failed: {}", attempt + 1, max_retries, last_error);
            if (attempt < max_retries - 1) {
                auto delay = config_.send_backoff_base * (1LL << attempt);
                if (stop_.wait_for(std::chrono::duration_cast<std::chrono::milliseconds>(delay))) {
                    break;
                }
            }
        }
    }

    spdlog::error("Failed to send transaction after {} attempts: {}", attempts, last_error);
    throw TransactionSubmitError("Failed to send transaction after " + std::to_string(attempts) +
                                 " attempts: " + last_error);
}

bool ResilientClient::confirm_transaction(const std::string& signature,
                                          const std::string& commitment,
                                          std::chrono::milliseconds max_wait) {
    if (router_) {
        return router_->confirm_transaction(signature, commitment, max_wait);
    }

    try {
        auto outcome = wait_for_confirmation(*rpc_, signature, commitment,
                                             config_.confirm_poll_interval, max_wait, stop_);
        if (outcome != ConfirmOutcome::Confirmed) {
            spdlog::warn("Transaction {} not confirmed", signature);
        }
        return outcome == ConfirmOutcome::Confirmed;
    } catch (const std::exception& e) {
        spdlog::error("Confirmation of {} failed: {}", signature, e.what());
        return false;
    }
}

std::optional<nlohmann::json> ResilientClient::post_rpc(const nlohmann::json& body) {
    if (router_) {
        return router_->post_rpc(body);
    }

    try {
        return rpc_->post(body, config_.rpc_timeout_ms);
    } catch (const std::exception& e) {
        spdlog::error("RPC POST to {} failed: {}", rpc_->url(), e.what());
        return std::nullopt;
    }
}

uint64_t ResilientClient::get_balance(const std::string& address) {
    return run([&](SolanaRpc& rpc) { return rpc.get_balance(address); });
}

std::optional<nlohmann::json> ResilientClient::get_account_info(const std::string& address) {
    return run([&](SolanaRpc& rpc) { return rpc.get_account_info(address); });
}

std::vector<std::optional<nlohmann::json>>
ResilientClient::get_multiple_accounts(const std::vector<std::string>& addresses) {
    return run([&](SolanaRpc& rpc) { return rpc.get_multiple_accounts(addresses); });
}

uint64_t ResilientClient::get_token_account_balance(const std::string& token_account) {
    return run([&](SolanaRpc& rpc) { return rpc.get_token_account_balance(token_account); });
}

uint64_t ResilientClient::get_token_balance(const std::string& owner, const std::string& mint) {
    auto accounts = run([&](SolanaRpc& rpc) { return rpc.get_token_accounts_by_owner(owner, mint); });

    uint64_t total = 0;
    for (const auto& account : accounts) {
        total += get_token_account_balance(account);
    }
    return total;
}

bool ResilientClient::get_health() {
    try {
        run([&](SolanaRpc& rpc) {
            rpc.get_health(config_.health_timeout_ms);
            return true;
        });
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Health query failed: {}", e.what());
        return false;
    }
}

std::shared_ptr<ResilientClient> make_client(const std::vector<std::string>& endpoints,
                                             std::shared_ptr<HttpClient> http,
                                             const RouterConfig& router_config,
                                             const ClientConfig& client_config) {
    if (endpoints.empty()) {
        throw ConstructionError("At least one RPC endpoint is required");
    }
    if (endpoints.size() == 1) {
        return std::make_shared<ResilientClient>(endpoints.front(), std::move(http), client_config);
    }
    auto router = std::make_shared<FailoverRouter>(endpoints, std::move(http), router_config);
    return std::make_shared<ResilientClient>(router, client_config);
}
