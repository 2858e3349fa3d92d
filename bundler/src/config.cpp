#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

uint64_t Config::get_env_u64(const char* name, uint64_t default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoull(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_req = get_env("STREAM_REQ", "sol.bundle.requests");
    cfg.stream_rep = get_env("STREAM_REP", "sol.bundle.replies");
    cfg.stream_audit = get_env("STREAM_AUDIT", "sol.bundle.audit");
    cfg.consumer_group = get_env("CONSUMER_GROUP", "bundler");
    cfg.consumer_name = get_env("CONSUMER_NAME", "bundler-1");

    cfg.pg_dsn = get_env("PG_DSN");

    cfg.rpc_urls = util::split(get_env("RPC_URLS"), ',');
    cfg.rpc_timeout_ms = get_env_int("RPC_TIMEOUT_MS", 10000);
    cfg.health_check_interval_ms = get_env_int("HEALTH_CHECK_INTERVAL_MS", 30000);
    cfg.blockhash_refresh_ms = get_env_int("BLOCKHASH_REFRESH_MS", 5000);
    cfg.min_success_rate = get_env_double("MIN_SUCCESS_RATE", 0.8);
    cfg.max_latency_ms = get_env_double("MAX_LATENCY_MS", 2000.0);
    cfg.send_max_retries = get_env_int("SEND_MAX_RETRIES", 3);
    cfg.http_max_connections = get_env_int("HTTP_MAX_CONNECTIONS", 100);
    cfg.http_max_per_host = get_env_int("HTTP_MAX_PER_HOST", 10);

    cfg.funding_keypair = get_env("FUNDING_KEYPAIR");
    cfg.funding_keypair_path = get_env("FUNDING_KEYPAIR_PATH");
    cfg.num_identities = get_env_int("NUM_IDENTITIES", 20);
    cfg.min_balance_sol = get_env_double("MIN_BALANCE_SOL", 0.1);
    cfg.target_balance_sol = get_env_double("TARGET_BALANCE_SOL", 1.0);
    cfg.identity_store_path = get_env("IDENTITY_STORE_PATH", "identities.json");

    cfg.relay_url = get_env("RELAY_URL", "https://mainnet.block-engine.jito.wtf");
    cfg.tip_accounts = util::split(get_env("TIP_ACCOUNTS", "96gYZGLnJYVFmbjzopPSU6QiEV5fGqZNyN9nmNhvrZU4"), ',');
    cfg.instruction_service_url = get_env("INSTRUCTION_SERVICE_URL", "http://localhost:8090/instructions");
    cfg.initial_tip_lamports = get_env_u64("INITIAL_TIP_LAMPORTS", 100000000);
    cfg.tip_increment_lamports = get_env_u64("TIP_INCREMENT_LAMPORTS", 50000000);
    cfg.max_tip_lamports = get_env_u64("MAX_TIP_LAMPORTS", 1000000000);
    cfg.bundle_max_retries = get_env_int("BUNDLE_MAX_RETRIES", 3);

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "bundler");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (rpc_urls.empty()) {
        throw std::runtime_error("RPC_URLS is required");
    }
    if (funding_keypair.empty() && funding_keypair_path.empty()) {
        throw std::runtime_error("FUNDING_KEYPAIR or FUNDING_KEYPAIR_PATH is required");
    }
    if (num_identities <= 0) {
        throw std::runtime_error("NUM_IDENTITIES must be positive");
    }
    if (target_balance_sol < min_balance_sol) {
        throw std::runtime_error("TARGET_BALANCE_SOL must not be below MIN_BALANCE_SOL");
    }
    if (max_tip_lamports < initial_tip_lamports) {
        throw std::runtime_error("MAX_TIP_LAMPORTS must not be below INITIAL_TIP_LAMPORTS");
    }
    if (tip_accounts.empty()) {
        throw std::runtime_error("TIP_ACCOUNTS must list at least one account");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  RPC providers: {}", rpc_urls.size());
    spdlog::info("  Identities: {} (min {:.3f} SOL, target {:.3f} SOL)",
                 num_identities, min_balance_sol, target_balance_sol);
    spdlog::info("  Tips: initial={} increment={} max={} lamports",
                 initial_tip_lamports, tip_increment_lamports, max_tip_lamports);
    spdlog::info("  Postgres: {}", pg_dsn.empty() ? "disabled" : util::redact_dsn(pg_dsn));
}
