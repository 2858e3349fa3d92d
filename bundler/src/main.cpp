#include "config.hpp"
#include "connection_pool.hpp"
#include "http_client.hpp"
#include "resilient_client.hpp"
#include "identity_pool.hpp"
#include "instruction_builder.hpp"
#include "bundle_relay.hpp"
#include "bundle_coordinator.hpp"
#include "bundle_store.hpp"
#include "command_args.hpp"
#include "redis_bus.hpp"
#include "health.hpp"
#include "keypair.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <optional>
#include <stdexcept>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("solbundle", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

struct Services {
    std::shared_ptr<Config> config;
    std::shared_ptr<ResilientClient> client;
    std::shared_ptr<IdentityPool> pool;
    std::shared_ptr<BundleCoordinator> coordinator;
    std::shared_ptr<BundleStore> store;
    std::shared_ptr<RedisBus> redis;
};

void send_reply(Services& svc, const std::string& corr_id, bool ok,
                const std::string& message, const nlohmann::json& data = nullptr) {
    nlohmann::json reply = {
        {"corr_id", corr_id},
        {"ok", ok},
        {"message", message},
        {"ts", util::current_iso8601()}
    };
    if (!data.is_null()) {
        reply["data"] = data;
    }
    svc.redis->publish_reply(svc.config->stream_rep, reply);
}

void track_attempts(Services& svc, const std::string& corr_id, const std::string& side, const std::string& target) {
    auto store = svc.store;
    auto redis = svc.redis;
    std::string audit_stream = svc.config->stream_audit;
    svc.coordinator->set_attempt_listener([store, redis, audit_stream, corr_id, side, target](const BundleAttempt& attempt) {
        if (store) {
            store->save_attempt(corr_id, side, target, attempt);
        }
        redis->publish_audit(audit_stream, {
            {"event", "bundle_" + to_string(attempt.state)},
            {"corr_id", corr_id},
            {"side", side},
            {"target", target},
            {"attempt", attempt.attempt},
            {"tip_lamports", attempt.tip},
            {"tx_count", attempt.transaction_count},
            {"detail", attempt.error.empty() ? attempt.bundle_id : attempt.error},
            {"ts", util::current_iso8601()}
        });
    });
}

void finish_bundle(Services& svc, const std::string& corr_id, const std::string& side,
                   const std::string& target, const BundleResult& result) {
    if (svc.store) {
        try {
            svc.store->save_result(corr_id, side, target, result);
        } catch (const std::exception& e) {
            spdlog::error("Bundle {} result not persisted: {}", corr_id, e.what());
        }
    }

    std::string message = result.success
        ? fmt::format("Bundle {} landed: {} transactions, tip {:.3f} SOL, {} attempt(s)",
                      result.bundle_id, result.transactions_submitted,
                      util::lamports_to_sol(result.tip_paid), result.attempts)
        : fmt::format("Bundle failed after {} attempt(s): {}", result.attempts, result.error_message);

    send_reply(svc, corr_id, result.success, message, result.to_json());
}

void handle_buy(const nlohmann::json& cmd, Services& svc) {
    std::string corr_id = cmd.value("corr_id", "");
    const auto& args = cmd.contains("args") ? cmd["args"] : nlohmann::json::object();

    std::string target = args.value("target", "");
    double amount_sol = args.value("amount_sol", 0.0);
    if (!util::is_valid_solana_address(target) || amount_sol <= 0.0) {
        send_reply(svc, corr_id, false, "Usage: buy {target: <mint>, amount_sol: <per identity>}");
        return;
    }

    std::optional<std::vector<size_t>> identities;
    std::optional<uint64_t> tip;
    try {
        identities = parse_identities(args);
        tip = parse_tip(args);
    } catch (const std::invalid_argument& e) {
        send_reply(svc, corr_id, false, fmt::format("Usage: buy {{identities: [<index>...], tip_lamports: <int>}}: {}", e.what()));
        return;
    }

    track_attempts(svc, corr_id, "buy", target);
    auto result = svc.coordinator->execute_buy(target, util::sol_to_lamports(amount_sol), identities, tip);
    finish_bundle(svc, corr_id, "buy", target, result);
    spdlog::info("Processed buy {} for {}: {}", corr_id, target, result.success ? "landed" : "failed");
}

void handle_sell(const nlohmann::json& cmd, Services& svc) {
    std::string corr_id = cmd.value("corr_id", "");
    const auto& args = cmd.contains("args") ? cmd["args"] : nlohmann::json::object();

    std::string target = args.value("target", "");
    double percentage = args.value("percentage", 0.0);
    if (!util::is_valid_solana_address(target) || !(percentage > 0.0 && percentage <= 1.0)) {
        send_reply(svc, corr_id, false, "Usage: sell {target: <mint>, percentage: (0, 1]}");
        return;
    }

    std::optional<std::vector<size_t>> identities;
    std::optional<uint64_t> tip;
    try {
        identities = parse_identities(args);
        tip = parse_tip(args);
    } catch (const std::invalid_argument& e) {
        send_reply(svc, corr_id, false, fmt::format("Usage: sell {{identities: [<index>...], tip_lamports: <int>}}: {}", e.what()));
        return;
    }

    track_attempts(svc, corr_id, "sell", target);
    auto result = svc.coordinator->execute_percentage_sell(target, percentage, identities, tip);
    finish_bundle(svc, corr_id, "sell", target, result);
    spdlog::info("Processed sell {} for {}: {}", corr_id, target, result.success ? "landed" : "failed");
}

void handle_rebalance(const nlohmann::json& cmd, Services& svc) {
    std::string corr_id = cmd.value("corr_id", "");
    size_t funded = svc.pool->rebalance();

    svc.redis->publish_audit(svc.config->stream_audit, {
        {"event", "identities_rebalanced"},
        {"corr_id", corr_id},
        {"detail", "funded=" + std::to_string(funded)},
        {"ts", util::current_iso8601()}
    });
    send_reply(svc, corr_id, true, fmt::format("Rebalanced: {} identities funded", funded),
               svc.pool->get_stats().to_json());
}

void handle_balances(const nlohmann::json& cmd, Services& svc) {
    std::string corr_id = cmd.value("corr_id", "");
    auto balances = svc.pool->get_all_balances();

    nlohmann::json rows = nlohmann::json::array();
    for (size_t i = 0; i < balances.size(); ++i) {
        rows.push_back({
            {"index", i},
            {"address", svc.pool->get_identity(i).keypair.pubkey().to_string()},
            {"balance_sol", util::lamports_to_sol(balances[i])}
        });
    }
    send_reply(svc, corr_id, true, fmt::format("{} identities", balances.size()), rows);
}

void handle_providers(const nlohmann::json& cmd, Services& svc) {
    std::string corr_id = cmd.value("corr_id", "");
    nlohmann::json data;
    if (auto router = svc.client->router()) {
        data = router->health_summary();
    } else {
        data = {{"current_provider", svc.client->endpoint()}};
    }
    send_reply(svc, corr_id, true, "Current provider: " + svc.client->endpoint(), data);
}

void command_consumer_loop(Services svc, std::atomic<bool>& running) {
    spdlog::info("Starting command consumer");
    svc.redis->ensure_group(svc.config->stream_req);

    while (running) {
        try {
            auto commands = svc.redis->read_commands(svc.config->stream_req, 10, std::chrono::milliseconds(1000));

            for (const auto& command : commands) {
                std::string cmd = command.body.value("cmd", "");
                try {
                    if (cmd == "buy") {
                        handle_buy(command.body, svc);
                    } else if (cmd == "sell") {
                        handle_sell(command.body, svc);
                    } else if (cmd == "rebalance") {
                        handle_rebalance(command.body, svc);
                    } else if (cmd == "balances") {
                        handle_balances(command.body, svc);
                    } else if (cmd == "providers") {
                        handle_providers(command.body, svc);
                    } else {
                        spdlog::warn("Unknown command: {}", cmd);
                    }
                } catch (const std::exception& e) {
                    spdlog::error("Failed to process {} command: {}", cmd, e.what());
                }
                svc.redis->ack(svc.config->stream_req, command.msg_id);
            }

        } catch (const std::exception& e) {
            spdlog::error("Command consumer error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    spdlog::info("Command consumer stopped");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->log_level);

        spdlog::info("==============================================");
        spdlog::info("SolBundle Bundler Service v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        PoolLimits limits;
        limits.max_total = static_cast<size_t>(config->http_max_connections);
        limits.max_per_host = static_cast<size_t>(config->http_max_per_host);
        auto connections = std::make_shared<ConnectionPool>(limits);
        auto http = std::make_shared<CurlHttpClient>(connections);

        RouterConfig router_config;
        router_config.health_check_interval = std::chrono::milliseconds(config->health_check_interval_ms);
        router_config.blockhash_refresh_interval = std::chrono::milliseconds(config->blockhash_refresh_ms);
        router_config.min_success_rate = config->min_success_rate;
        router_config.max_latency_ms = config->max_latency_ms;
        router_config.rpc_timeout_ms = config->rpc_timeout_ms;

        ClientConfig client_config;
        client_config.rpc_timeout_ms = config->rpc_timeout_ms;
        client_config.send_max_retries = config->send_max_retries;
        client_config.blockhash_refresh_interval = router_config.blockhash_refresh_interval;

        auto client = make_client(config->rpc_urls, http, router_config, client_config);
        client->start();

        Keypair funding = config->funding_keypair.empty()
            ? Keypair::from_file(config->funding_keypair_path)
            : Keypair::from_base58(config->funding_keypair);
        spdlog::info("Funding identity: {}", funding.pubkey().to_string());

        PoolConfig pool_config;
        pool_config.num_identities = static_cast<size_t>(config->num_identities);
        pool_config.min_balance = util::sol_to_lamports(config->min_balance_sol);
        pool_config.target_balance = util::sol_to_lamports(config->target_balance_sol);
        pool_config.storage_path = config->identity_store_path;
        auto pool = std::make_shared<IdentityPool>(client, pool_config);
        pool->initialize(funding);

        auto builder = std::make_shared<HttpInstructionBuilder>(config->instruction_service_url, http,
                                                                config->rpc_timeout_ms);
        auto relay = std::make_shared<HttpBundleRelay>(config->relay_url, http, client, funding,
                                                       config->tip_accounts, config->rpc_timeout_ms);

        CoordinatorConfig coordinator_config;
        coordinator_config.initial_tip = config->initial_tip_lamports;
        coordinator_config.tip_increment = config->tip_increment_lamports;
        coordinator_config.max_tip = config->max_tip_lamports;
        coordinator_config.max_retries = config->bundle_max_retries;
        auto coordinator = std::make_shared<BundleCoordinator>(pool, client, builder, relay, coordinator_config);

        auto redis = std::make_shared<RedisBus>(config->redis_url, config->consumer_group, config->consumer_name);

        std::shared_ptr<BundleStore> store;
        if (!config->pg_dsn.empty()) {
            store = std::make_shared<BundleStore>(config->pg_dsn);
            store->init_schema();
        }

        auto health = std::make_shared<HealthCheck>(redis, store, client, pool, coordinator);

        Services services{config, client, pool, coordinator, store, redis};

        std::atomic<bool> consumer_running{true};
        std::thread consumer_thread(command_consumer_loop, services, std::ref(consumer_running));

        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        server.Get("/stats", [health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health->get_stats().dump(), "application/json");
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("Bundler service started");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        spdlog::info("Stopping services...");
        consumer_running = false;
        coordinator->cancel();
        server.stop();

        if (consumer_thread.joinable()) consumer_thread.join();
        if (http_thread.joinable()) http_thread.join();

        client->stop();
        connections->shutdown();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
