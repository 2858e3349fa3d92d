#include "failover_router.hpp"
#include <algorithm>
#include <future>

FailoverRouter::FailoverRouter(const std::vector<std::string>& urls,
                               std::shared_ptr<HttpClient> http,
                               const RouterConfig& config)
    : config_(config)
    , http_(http)
{
    if (urls.empty()) {
        throw ConstructionError("FailoverRouter requires at least one provider");
    }
    if (!http) {
        throw ConstructionError("FailoverRouter requires an HTTP client");
    }

    for (const auto& url : urls) {
        Provider p;
        p.url = url;
        p.rpc = std::make_unique<SolanaRpc>(url, http, config_.rpc_timeout_ms);
        p.health = std::make_unique<ProviderHealthTracker>(url);
        providers_.push_back(std::move(p));
    }

    blockhash_ = std::make_unique<BlockhashCache>(
        [this]() { return get_latest_blockhash(); }, config_.blockhash_max_age);

    spdlog::info("FailoverRouter initialized with {} providers", providers_.size());
}

FailoverRouter::~FailoverRouter() {
    stop();
}

void FailoverRouter::start() {
    if (running_.exchange(true)) {
        spdlog::debug("FailoverRouter already running");
        return;
    }
    stop_.reset();

    check_all_providers();
    spdlog::info("Initial provider: {}", current_provider());

    health_thread_ = std::thread(&FailoverRouter::health_check_loop, this);
    blockhash_->start(config_.blockhash_refresh_interval);
}

void FailoverRouter::stop() {
    if (running_.exchange(false)) {
        stop_.request_stop();
        blockhash_->stop();
        if (health_thread_.joinable()) {
            health_thread_.join();
        }
        stop_.reset();
        spdlog::info("FailoverRouter stopped");
    } else {
        stop_.interrupt();
    }

    for (const auto& p : providers_) {
        http_->close_idle(p.url);
    }
}

void FailoverRouter::health_check_loop() {
    spdlog::info("Health check loop started (every {}ms)", config_.health_check_interval.count());

    while (!stop_.wait_for(config_.health_check_interval)) {
        try {
            check_all_providers();
        } catch (const std::exception& e) {
            spdlog::error("Health check round failed: {}", e.what());
        }
    }

    spdlog::info("Health check loop stopped");
}

void FailoverRouter::check_provider(size_t index) {
    Provider& p = providers_.at(index);
    auto started = std::chrono::steady_clock::now();

    try {
        p.rpc->get_health(config_.health_check_timeout_ms);
        std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started;
        p.health->record_success(elapsed.count());
    } catch (const TransportError& e) {
        p.health->record_failure(e.timed_out() ? "Timeout" : e.what());
    } catch (const std::exception& e) {
        p.health->record_failure(e.what());
    }

    spdlog::debug("Health {}: {}", p.url, to_string(p.health->status()));
}

void FailoverRouter::check_all_providers() {
    std::vector<std::future<void>> checks;
    checks.reserve(providers_.size());
    for (size_t i = 0; i < providers_.size(); ++i) {
        checks.push_back(std::async(std::launch::async, [this, i]() { check_provider(i); }));
    }
    for (auto& f : checks) {
        f.get();
    }
    select_best();
}

const std::string& FailoverRouter::select_best() {
    return select_best(std::set<size_t>{});
}

const std::string& FailoverRouter::select_best(const std::set<size_t>& avoid) {
    std::lock_guard<std::mutex> lock(select_mutex_);

    std::vector<size_t> pool;
    for (size_t i = 0; i < providers_.size(); ++i) {
        if (!avoid.count(i)) pool.push_back(i);
    }
    if (pool.empty()) {
        for (size_t i = 0; i < providers_.size(); ++i) pool.push_back(i);
    }

    std::vector<std::pair<size_t, ProviderHealth>> candidates;
    for (size_t i : pool) {
        auto h = providers_[i].health->snapshot();
        bool usable = (h.status == ProviderStatus::Healthy || h.status == ProviderStatus::Degraded) &&
                      h.success_rate >= config_.min_success_rate &&
                      h.avg_latency_ms <= config_.max_latency_ms;
        if (usable) candidates.emplace_back(i, h);
    }

    if (candidates.empty()) {
        spdlog::warn("No healthy providers available, ranking all candidates");
        for (size_t i : pool) {
            candidates.emplace_back(i, providers_[i].health->snapshot());
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        return a.second.score > b.second.score;
    });

    size_t best = candidates.front().first;
    size_t previous = current_.load();
    if (best != previous) {
        current_.store(best);
        spdlog::info("Switched RPC provider: {} -> {} (score {:.3f})",
                     providers_[previous].url, providers_[best].url, candidates.front().second.score);
    }
    return providers_[best].url;
}

const std::string& FailoverRouter::current_provider() const {
    return providers_[current_.load()].url;
}

ProviderHealth FailoverRouter::health(size_t index) const {
    return providers_.at(index).health->snapshot();
}

nlohmann::json FailoverRouter::health_summary() const {
    nlohmann::json providers = nlohmann::json::array();
    for (const auto& p : providers_) {
        providers.push_back(p.health->snapshot().to_json());
    }
    return {
        {"current_provider", current_provider()},
        {"providers", providers}
    };
}

std::string FailoverRouter::get_latest_blockhash() {
    return execute_with_failover([](SolanaRpc& rpc) {
        return rpc.get_latest_blockhash().blockhash;
    });
}

std::string FailoverRouter::get_cached_blockhash() {
    return blockhash_->get();
}

std::string FailoverRouter::send_transaction(const std::string& base64_tx, bool skip_preflight) {
    return execute_with_failover([&](SolanaRpc& rpc) {
        return rpc.send_transaction(base64_tx, skip_preflight);
    });
}

bool FailoverRouter::confirm_transaction(const std::string& signature,
                                         const std::string& commitment,
                                         std::chrono::milliseconds max_wait) {
    try {
        auto outcome = execute_with_failover([&](SolanaRpc& rpc) {
            return wait_for_confirmation(rpc, signature, commitment,
                                         config_.confirm_poll_interval, max_wait, stop_);
        }, config_.confirm_retries);

        if (outcome != ConfirmOutcome::Confirmed) {
            spdlog::warn("Transaction {} not confirmed", signature);
        }
        return outcome == ConfirmOutcome::Confirmed;
    } catch (const AllProvidersExhausted& e) {
        spdlog::error("Confirmation of {} failed: {}", signature, e.what());
        return false;
    }
}

std::optional<nlohmann::json> FailoverRouter::post_rpc(const nlohmann::json& body) {
    try {
        return execute_with_failover([&](SolanaRpc& rpc) {
            return rpc.post(body, config_.rpc_timeout_ms);
        });
    } catch (const AllProvidersExhausted& e) {
        spdlog::error("RPC POST failed: {}", e.what());
        return std::nullopt;
    }
}
