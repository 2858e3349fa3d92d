#pragma once

#include "blockhash_cache.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "provider_health.hpp"
#include "solana_rpc.hpp"
#include "stop_signal.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

struct RouterConfig {
    std::chrono::milliseconds health_check_interval{30000};
    std::chrono::milliseconds blockhash_refresh_interval{5000};
    double min_success_rate = 0.8;
    double max_latency_ms = 2000.0;
    int health_check_timeout_ms = 5000;
    int rpc_timeout_ms = 10000;
    std::chrono::milliseconds backoff_base{500};
    int max_retries = 3;
    int confirm_retries = 5;
    std::chrono::milliseconds confirm_poll_interval{1000};
    std::chrono::milliseconds blockhash_max_age{60000};
};

// Routes JSON-RPC calls to the best-scoring provider and retries across
// providers on failure. Owns the health-check loop and the shared blockhash.
class FailoverRouter {
public:
    // Throws ConstructionError when urls is empty.
    FailoverRouter(const std::vector<std::string>& urls,
                   std::shared_ptr<HttpClient> http,
                   const RouterConfig& config = RouterConfig{});
    ~FailoverRouter();

    FailoverRouter(const FailoverRouter&) = delete;
    FailoverRouter& operator=(const FailoverRouter&) = delete;

    void start();
    // Joins both loops, wakes any failover backoff or confirmation poll in
    // progress and closes idle connections to every provider. Calls made
    // afterwards retry normally.
    void stop();
    bool running() const { return running_.load(); }

    const std::string& select_best();
    void check_all_providers();
    void check_provider(size_t index);

    const std::string& current_provider() const;
    size_t provider_count() const { return providers_.size(); }
    ProviderHealth health(size_t index) const;
    nlohmann::json health_summary() const;
    const RouterConfig& config() const { return config_; }

    // Runs op(SolanaRpc&) against the current provider, moving to the next
    // best provider after each failure. max_retries <= 0 uses the configured
    // default. Throws AllProvidersExhausted.
    template <typename Op>
    auto execute_with_failover(Op&& op, int max_retries = 0)
        -> decltype(op(std::declval<SolanaRpc&>()));

    std::string get_latest_blockhash();
    std::string get_cached_blockhash();
    std::string send_transaction(const std::string& base64_tx, bool skip_preflight = false);
    bool confirm_transaction(const std::string& signature,
                             const std::string& commitment = "confirmed",
                             std::chrono::milliseconds max_wait = std::chrono::milliseconds(0));
    std::optional<nlohmann::json> post_rpc(const nlohmann::json& body);

    BlockhashCache& blockhash_cache() { return *blockhash_; }

private:
    struct Provider {
        std::string url;
        std::unique_ptr<SolanaRpc> rpc;
        std::unique_ptr<ProviderHealthTracker> health;
    };

    RouterConfig config_;
    std::shared_ptr<HttpClient> http_;
    std::vector<Provider> providers_;
    std::atomic<size_t> current_{0};
    std::mutex select_mutex_;

    std::unique_ptr<BlockhashCache> blockhash_;
    std::atomic<bool> running_{false};
    StopSignal stop_;
    std::thread health_thread_;

    const std::string& select_best(const std::set<size_t>& avoid);
    void health_check_loop();
};

template <typename Op>
auto FailoverRouter::execute_with_failover(Op&& op, int max_retries)
    -> decltype(op(std::declval<SolanaRpc&>()))
{
    if (max_retries <= 0) {
        max_retries = config_.max_retries;
    }

    std::set<size_t> attempted;
    std::string last_error = "no attempt made";
    std::string last_url;
    int attempts = 0;

    for (int attempt = 0; attempt < max_retries; ++attempt) {
        if (attempted.size() >= providers_.size()) {
            attempted.clear();
        }
        size_t index = current_.load();
        if (attempted.count(index)) {
            select_best(attempted);
            index = current_.load();
        }
        attempted.insert(index);

        Provider& provider = providers_[index];
        last_url = provider.url;
        attempts++;

        auto started = std::chrono::steady_clock::now();
        try {
            auto result = op(*provider.rpc);
            std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
            provider.health->record_success(elapsed.count());
            return result;
        } catch (const std::exception& e) {
            last_error = e.what();
            provider.health->record_failure(last_error);
            spdlog::warn("RPC via {} failed (attempt {}/{}): {}",
                         provider.url, attempt + 1, max_retries, last_error);

            select_best(attempted);

            if (attempt < max_retries - 1) {
                auto delay = config_.backoff_base * (1LL << attempt);
                if (stop_.wait_for(std::chrono::duration_cast<std::chrono::milliseconds>(delay))) {
                    spdlog::info("Failover retry cancelled by stop");
                    break;
                }
            }
        }
    }

    spdlog::error("All providers failed after {} attempts, last error from {}: {}",
                  attempts, last_url, last_error);
    throw AllProvidersExhausted(attempts, last_url, last_error);
}
